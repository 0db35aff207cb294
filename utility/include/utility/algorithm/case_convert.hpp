#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed string to upper case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toUpperCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
    }

    /**
     * @brief Converts the passed string to lower case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toLowerCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }

    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result{input};
        toLowerCaseInplace(result);
        return result;
    }

    /**
     * @brief Compares two strings ignoring ASCII case. Ties are broken by the case sensitive order, so that the
     * result is a strict weak ordering usable for stable listings.
     *
     * @return true if lhs sorts before rhs.
     */
    inline bool lessCaseInsensitive(std::string_view lhs, std::string_view rhs)
    {
        const auto mismatch = std::mismatch(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char l, unsigned char r) {
                return std::tolower(l) == std::tolower(r);
            });

        if (mismatch.first == lhs.end() || mismatch.second == rhs.end())
        {
            if (lhs.size() != rhs.size())
                return lhs.size() < rhs.size();
            return lhs < rhs;
        }

        return std::tolower(static_cast<unsigned char>(*mismatch.first)) <
            std::tolower(static_cast<unsigned char>(*mismatch.second));
    }
}
