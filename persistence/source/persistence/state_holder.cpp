#include <persistence/state_holder.hpp>
#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace Persistence
{
    namespace
    {
        constexpr char const* applicationDirectory = "sftp-commander";
        constexpr char const* configurationFile = "config.json";

        std::expected<nlohmann::json, SecureShell::Error> readJson(std::filesystem::path const& file)
        {
            std::ifstream reader{file, std::ios_base::binary};
            if (!reader.good())
            {
                return std::unexpected(
                    SecureShell::makeError(SecureShell::ErrorKind::NotFoundError, "Cannot open file", file.string()));
            }

            try
            {
                return nlohmann::json::parse(reader, nullptr, true, true);
            }
            catch (nlohmann::json::exception const& e)
            {
                return std::unexpected(SecureShell::makeError(
                    SecureShell::ErrorKind::ConfigurationError,
                    fmt::format("Cannot parse file: {}", e.what()),
                    file.string()));
            }
        }

        void createParentDirectories(std::filesystem::path const& file)
        {
            const auto parent = file.parent_path();
            if (parent.empty())
                return;

            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
                throw std::runtime_error(fmt::format("Cannot create directory '{}': {}", parent.string(), ec.message()));
        }
    }

    std::filesystem::path defaultConfigurationPath()
    {
        if (char const* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            return std::filesystem::path{xdg} / applicationDirectory / configurationFile;
        if (char const* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            return std::filesystem::path{home} / ".config" / applicationDirectory / configurationFile;
        return std::filesystem::path{applicationDirectory} / configurationFile;
    }

    StateHolder::StateHolder(std::filesystem::path path)
        : path_{std::move(path)}
        , stateCache_{}
    {}

    State& StateHolder::stateCache()
    {
        return stateCache_;
    }
    State const& StateHolder::stateCache() const
    {
        return stateCache_;
    }
    std::filesystem::path const& StateHolder::path() const
    {
        return path_;
    }

    void StateHolder::makeBackup() const
    {
        const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        const auto backupFileName =
            path_.parent_path() / (path_.filename().string() + ".backup_" + fmt::format("{:%Y-%m-%d_%H-%M-%S}", now));

        {
            std::ifstream reader{path_, std::ios_base::binary};
            std::ofstream writer{backupFileName, std::ios_base::binary};
            writer << reader.rdbuf();
        }
        Log::info("Copied config file to backup: {}", backupFileName.string());
    }

    bool StateHolder::load()
    {
        stateCache_ = {};

        auto before = [this]() {
            std::error_code ec;
            if (!std::filesystem::exists(path_, ec))
            {
                Log::warn("Config file '{}' does not exist, creating it with defaults.", path_.string());
                return nlohmann::json::object();
            }

            auto json = readJson(path_);
            if (!json)
            {
                Log::error("Failed to load config file: {}", json.error().toString());
                if (json.error().kind == SecureShell::ErrorKind::ConfigurationError)
                    makeBackup();
                return nlohmann::json::object();
            }
            return std::move(json).value();
        }();

        try
        {
            before.get_to(stateCache_);
        }
        catch (std::exception const& e)
        {
            Log::error("Config file has invalid contents: {}", e.what());
            makeBackup();
            stateCache_ = {};
            before = nlohmann::json::object();
        }

        try
        {
            dataFixer(before);
            return true;
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to write config file: {}", e.what());
            return false;
        }
    }

    void StateHolder::dataFixer(nlohmann::json const& before)
    {
        const auto after = nlohmann::json(stateCache_);
        const auto diff = nlohmann::json::diff(before, after);

        if (!diff.empty())
        {
            Log::warn("Config diff: {}", diff.dump());
            Log::warn("Config file misses some defaults, writing them back to disk.");
            save();
        }
    }

    void StateHolder::save()
    {
        try
        {
            createParentDirectories(path_);
            std::ofstream writer{path_, std::ios_base::binary | std::ios_base::trunc};
            if (!writer.is_open())
                throw std::runtime_error(fmt::format("Cannot open '{}' for writing", path_.string()));
            writer << nlohmann::json(stateCache_).dump(4);
            if (!writer.good())
                throw std::runtime_error(fmt::format("Cannot write '{}'", path_.string()));
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to save config file: {}", e.what());
            throw;
        }
    }

    void StateHolder::addProfile(std::string const& name, ConnectionProfile profile)
    {
        stateCache_.profiles[name] = std::move(profile);
    }

    bool StateHolder::removeProfile(std::string const& name)
    {
        return stateCache_.profiles.erase(name) > 0;
    }

    std::optional<ConnectionProfile> StateHolder::profile(std::string const& name) const
    {
        if (auto iter = stateCache_.profiles.find(name); iter != stateCache_.profiles.end())
            return iter->second;
        return std::nullopt;
    }

    std::vector<std::string> StateHolder::profileNames() const
    {
        std::vector<std::string> names;
        names.reserve(stateCache_.profiles.size());
        for (auto const& [name, _] : stateCache_.profiles)
            names.push_back(name);
        return names;
    }

    std::expected<std::size_t, SecureShell::Error>
    StateHolder::exportProfiles(std::filesystem::path const& file, std::vector<std::string> const& names) const
    {
        std::map<std::string, ConnectionProfile> selection{};
        if (names.empty())
            selection = stateCache_.profiles;

        for (auto const& name : names)
        {
            const auto iter = stateCache_.profiles.find(name);
            if (iter == stateCache_.profiles.end())
            {
                return std::unexpected(SecureShell::makeError(
                    SecureShell::ErrorKind::ConfigurationError, fmt::format("Unknown profile '{}'", name)));
            }
            selection.insert(*iter);
        }

        try
        {
            createParentDirectories(file);
        }
        catch (std::exception const& e)
        {
            return std::unexpected(SecureShell::makeError(SecureShell::ErrorKind::IOError, e.what(), file.string()));
        }

        std::ofstream writer{file, std::ios_base::binary | std::ios_base::trunc};
        writer << nlohmann::json{{"profiles", selection}}.dump(4);
        if (!writer.good())
        {
            return std::unexpected(
                SecureShell::makeError(SecureShell::ErrorKind::IOError, "Cannot write profile export", file.string()));
        }

        Log::info("Exported {} profile(s) to '{}'.", selection.size(), file.string());
        return selection.size();
    }

    std::expected<std::size_t, SecureShell::Error>
    StateHolder::importProfiles(std::filesystem::path const& file, bool overwrite)
    {
        const auto json = readJson(file);
        if (!json)
            return std::unexpected(json.error());

        std::map<std::string, ConnectionProfile> imported{};
        try
        {
            json->at("profiles").get_to(imported);
        }
        catch (nlohmann::json::exception const& e)
        {
            return std::unexpected(SecureShell::makeError(
                SecureShell::ErrorKind::ConfigurationError,
                fmt::format("Malformed profile export: {}", e.what()),
                file.string()));
        }

        std::size_t count = 0;
        for (auto& [name, profile] : imported)
        {
            if (stateCache_.profiles.contains(name) && !overwrite)
            {
                Log::info("Skipping import of existing profile '{}'.", name);
                continue;
            }
            stateCache_.profiles[name] = std::move(profile);
            ++count;
        }
        Log::info("Imported {} profile(s) from '{}'.", count, file.string());
        return count;
    }
}
