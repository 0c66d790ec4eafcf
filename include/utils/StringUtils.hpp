#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <type_traits>

namespace StatTrack::Utils {
    /// Escape '|', '\\', CR and LF so a value fits in one journal field.
    std::string escapeField(std::string_view s);

    /// Reverse of escapeField(). Unknown escapes keep the escaped character.
    std::string unescapeField(std::string_view s);

    /// Split a journal record on unescaped '|' separators (fields stay escaped).
    std::vector<std::string_view> splitRecord(std::string_view record);

    /// 64-bit FNV-1a hash, used for line checksums.
    std::uint64_t fnv1a64(std::string_view data) noexcept;
}

namespace StatTrack
{
    namespace Utils
    {
        /**
         * String utility helpers for parsing game-server log text and
         * configuration values.
         *
         * All functions are stateless and thread-safe, and use
         * std::string_view where possible to avoid unnecessary copies.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Check if a string_view starts with a given prefix (case-sensitive).
        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Check if a string_view ends with a given suffix (case-sensitive).
        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size()
                   && sv.compare(sv.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /**
         * Split a string_view by a multi-character delimiter (e.g. " + " in
         * a kill line's killer list). Empty fields are dropped.
         */
        inline std::vector<std::string_view> split(
            std::string_view sv,
            std::string_view delimiter)
        {
            std::vector<std::string_view> result;
            if (delimiter.empty())
            {
                if (!sv.empty())
                    result.push_back(sv);
                return result;
            }

            std::size_t start = 0;
            while (start <= sv.size())
            {
                const std::size_t pos = sv.find(delimiter, start);
                const bool found = (pos != std::string_view::npos);
                const std::size_t end = found ? pos : sv.size();

                if (end > start)
                {
                    result.emplace_back(sv.data() + start, end - start);
                }

                if (!found)
                {
                    break;
                }
                start = end + delimiter.size();
            }

            return result;
        }

        /**
         * Safely parse an integer from a string_view.
         *
         * Returns std::nullopt if parsing fails or if there are
         * non-numeric trailing characters after trimming.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::string s(sv); // local copy for stream parsing
            std::istringstream iss(s);
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace Utils
} // namespace StatTrack
