#include <log/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    bool Logger::setup(LogOptions const& options)
    {
        std::vector<spdlog::sink_ptr> sinks{};
        bool fileSinkCreated = true;

        if (options.console)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (options.directory)
        {
            try
            {
                std::filesystem::create_directories(*options.directory);
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (*options.directory / options.fileName).string(), options.maxFileSize, options.maxFiles));
            }
            catch (std::exception const& e)
            {
                spdlog::error("Failed to create log file in '{}': {}", options.directory->string(), e.what());
                fileSinkCreated = false;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sftp-commander", sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        logger->set_level(toSpdlogLevel(options.level));
        logger->flush_on(spdlog::level::err);

        {
            std::scoped_lock lock{guard_};
            logger_ = std::move(logger);
        }
        spdlog::set_level(toSpdlogLevel(options.level));
        return fileSinkCreated;
    }

    void Logger::reset()
    {
        std::scoped_lock lock{guard_};
        if (logger_)
            logger_->flush();
        logger_.reset();
    }

    void Logger::flush()
    {
        std::scoped_lock lock{guard_};
        if (logger_)
            logger_->flush();
        else
            spdlog::default_logger()->flush();
    }

    bool setup(LogOptions const& options)
    {
        return Detail::logger.setup(options);
    }

    void flush()
    {
        Detail::logger.flush();
    }
}
