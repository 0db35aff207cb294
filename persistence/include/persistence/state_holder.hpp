#pragma once

#include <persistence/state/state.hpp>
#include <ssh/error.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    /**
     * @brief $XDG_CONFIG_HOME/sftp-commander/config.json, or $HOME/.config/sftp-commander/config.json.
     * Falls back to the working directory if neither variable is set.
     */
    std::filesystem::path defaultConfigurationPath();

    /**
     * @brief Owns the settings and profiles and their file on disk.
     */
    class StateHolder
    {
      public:
        explicit StateHolder(std::filesystem::path path = defaultConfigurationPath());

        /**
         * @brief Reads the configuration file.
         *
         * A missing file yields defaults, which are written back. A file that cannot be parsed is copied to
         * "<file>.backup_<timestamp>" and replaced by defaults.
         *
         * @return false if the defaults could not be written back.
         */
        bool load();

        /**
         * @brief Writes the configuration as pretty printed JSON, creating parent directories.
         *
         * @throws std::runtime_error if the file cannot be written.
         */
        void save();

        State& stateCache();
        State const& stateCache() const;
        std::filesystem::path const& path() const;

        /// Adds or replaces.
        void addProfile(std::string const& name, ConnectionProfile profile);
        bool removeProfile(std::string const& name);
        std::optional<ConnectionProfile> profile(std::string const& name) const;
        std::vector<std::string> profileNames() const;

        /**
         * @brief Writes profiles to a standalone file.
         *
         * @param names Profiles to export, all of them if empty.
         * @return The amount exported, or ConfigurationError for unknown names and IOError if writing fails.
         */
        std::expected<std::size_t, SecureShell::Error>
        exportProfiles(std::filesystem::path const& file, std::vector<std::string> const& names = {}) const;

        /**
         * @brief Reads profiles written by exportProfiles. Profiles with an existing name are skipped unless
         * overwrite is set. Does not save.
         *
         * @return The amount imported, or NotFoundError and ConfigurationError for missing or malformed files.
         */
        std::expected<std::size_t, SecureShell::Error> importProfiles(std::filesystem::path const& file, bool overwrite);

      private:
        void dataFixer(nlohmann::json const& before);
        void makeBackup() const;

      private:
        std::filesystem::path path_;
        State stateCache_;
    };
}
