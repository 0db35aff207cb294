#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    struct LogOptions
    {
        Level level{Level::Info};
        std::optional<std::filesystem::path> directory{std::nullopt};
        std::string fileName{"sftp-commander.log"};
        std::size_t maxFileSize{5 * 1024 * 1024};
        std::size_t maxFiles{5};
        bool console{true};
    };

    class Logger
    {
      public:
        Logger()
            : guard_{}
            , logger_{}
        {}

        /**
         * @brief Replaces the sinks of this logger. Creates the log directory if necessary.
         *
         * @param options
         * @return false if the file sink could not be created, the console sink is installed regardless.
         */
        bool setup(LogOptions const& options);

        /**
         * @brief Drops all sinks, logging falls back to the spdlog default logger.
         */
        void reset();

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                logger_->set_level(toSpdlogLevel(level));
            spdlog::set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            std::scoped_lock lock{guard_};
            if (logger_)
                return fromSpdlogLevel(logger_->level());
            return fromSpdlogLevel(spdlog::get_level());
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!shouldLog(level))
                return;
            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::shared_ptr<spdlog::logger> logger;
            {
                std::scoped_lock lock{guard_};
                logger = logger_;
            }
            if (logger)
                logger->log(toSpdlogLevel(level), msg);
            else
                spdlog::log(toSpdlogLevel(level), msg);
        }

        void flush();

      private:
        bool shouldLog(Log::Level level) const
        {
            return level != Level::Off && level >= this->level();
        }

      private:
        mutable std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
    };
}
