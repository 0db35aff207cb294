#include <ssh/path_resolver.hpp>

#include <filesystem>
#include <vector>

namespace SecureShell
{
    namespace
    {
        std::filesystem::path stripTrailingSeparator(std::filesystem::path path)
        {
            if (!path.has_filename() && path.has_relative_path())
                return path.parent_path();
            return path;
        }

        std::string resolveLocal(std::string_view cursor, std::string_view token)
        {
            const std::filesystem::path cursorPath = stripTrailingSeparator(std::filesystem::path{cursor}.lexically_normal());

            if (token.empty() || token == ".")
                return cursorPath.string();

            const std::filesystem::path tokenPath{token};
            if (tokenPath.is_absolute())
                return stripTrailingSeparator(tokenPath.lexically_normal()).string();

            return stripTrailingSeparator((cursorPath / tokenPath).lexically_normal()).string();
        }
    }

    std::string normalizeRemotePath(std::string_view path)
    {
        std::vector<std::string_view> segments{};

        std::size_t position = 0;
        while (position <= path.size())
        {
            auto next = path.find('/', position);
            if (next == std::string_view::npos)
                next = path.size();

            const auto segment = path.substr(position, next - position);
            if (segment == "..")
            {
                if (!segments.empty())
                    segments.pop_back();
            }
            else if (!segment.empty() && segment != ".")
            {
                segments.push_back(segment);
            }
            position = next + 1;
        }

        if (segments.empty())
            return "/";

        std::string result{};
        for (auto const& segment : segments)
        {
            result.push_back('/');
            result.append(segment);
        }
        return result;
    }

    std::string remoteFileName(std::string_view path)
    {
        const auto normalized = normalizeRemotePath(path);
        return normalized.substr(normalized.rfind('/') + 1);
    }

    std::string resolvePath(std::string_view cursor, std::string_view token, AddressSpace addressSpace)
    {
        if (addressSpace == AddressSpace::Local)
            return resolveLocal(cursor, token);

        if (token.empty() || token == ".")
            return normalizeRemotePath(cursor);

        if (token.front() == '/')
            return normalizeRemotePath(token);

        std::string combined{cursor};
        combined.push_back('/');
        combined.append(token);
        return normalizeRemotePath(combined);
    }
}
