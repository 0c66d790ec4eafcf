#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace StatTrack
{
    namespace Utils
    {
        /**
         * Time utilities for game-log timestamps, match ids and scheduling.
         *
         * Notes:
         *  - system_clock is used for wall-clock timestamps coming from logs
         *    and for snapshot times.
         *  - Game-server timestamps carry no zone and are treated as UTC, so
         *    match ids derived from them do not depend on the host's zone.
         *  - Parsing functions return std::optional to signal failures instead
         *    of throwing.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;
        using seconds      = std::chrono::seconds;

        /// Convert a TimePoint to time_t (second precision).
        std::time_t to_time_t(TimePoint tp) noexcept;

        /// Current system time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint (local time) into a human-readable string.
         * Default format: "YYYY-MM-DD HH:MM:SS".
         */
        std::string formatTimestamp(TimePoint tp,
                                     std::string_view format = "%Y-%m-%d %H:%M:%S");

        /**
         * Parse an Unreal server log timestamp "YYYY.MM.DD-HH.MM.SS:mmm"
         * (the millisecond part may have 1 to 3 digits) as UTC.
         */
        std::optional<TimePoint> parseGameTimestamp(std::string_view sv);

        /// Format a TimePoint (UTC) as "YYYY.MM.DD-HH.MM.SS:mmm".
        std::string formatGameTimestamp(TimePoint tp);

        /// Milliseconds since epoch; used in match ids and journal records.
        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept;

        /// Convert milliseconds since epoch back to TimePoint.
        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept;

    } // namespace Utils
} // namespace StatTrack
