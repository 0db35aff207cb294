#pragma once

#include <filesystem>

namespace Utility
{
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();

        /**
         * @brief Creates a unique directory below basePath.
         *
         * @param basePath Created if it does not exist.
         * @param removeBase Also remove basePath on destruction (only succeeds when it is empty).
         */
        TemporaryDirectory(std::filesystem::path basePath, bool removeBase);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBase;
    };
}
