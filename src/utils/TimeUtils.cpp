#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace StatTrack
{
    namespace Utils
    {
        std::time_t to_time_t(TimePoint tp) noexcept
        {
            return Clock::to_time_t(tp);
        }

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        namespace
        {
            std::tm utcParts(TimePoint tp, int &millis)
            {
                const std::int64_t ms = toMillisSinceEpoch(tp);
                std::int64_t secs = ms / 1000;
                millis = static_cast<int>(ms % 1000);
                if (millis < 0)
                {
                    millis += 1000;
                    --secs;
                }

                const std::time_t t = static_cast<std::time_t>(secs);
                std::tm tm_buf{};
            #if defined(_WIN32)
                gmtime_s(&tm_buf, &t);
            #else
                gmtime_r(&t, &tm_buf);
            #endif
                return tm_buf;
            }

            // Digits-only field; std::nullopt on anything else.
            std::optional<int> parseDigits(std::string_view sv)
            {
                if (sv.empty())
                {
                    return std::nullopt;
                }
                int value = 0;
                for (char c : sv)
                {
                    if (c < '0' || c > '9')
                    {
                        return std::nullopt;
                    }
                    value = value * 10 + (c - '0');
                }
                return value;
            }

            // Days since 1970-01-01 for a proleptic Gregorian date.
            std::int64_t daysFromCivil(int y, int m, int d) noexcept
            {
                y -= m <= 2 ? 1 : 0;
                const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = static_cast<unsigned>((153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1);
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
            }
        } // anonymous namespace

        std::string formatGameTimestamp(TimePoint tp)
        {
            int millis = 0;
            const std::tm tm_buf = utcParts(tp, millis);

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, "%Y.%m.%d-%H.%M.%S")
                << ':' << std::setw(3) << std::setfill('0') << millis;
            return oss.str();
        }

        // -------- Parsing helpers --------

        std::optional<TimePoint> parseGameTimestamp(std::string_view sv)
        {
            // Expected: "YYYY.MM.DD-HH.MM.SS:m" .. "YYYY.MM.DD-HH.MM.SS:mmm"
            if (sv.size() < 21 || sv.size() > 23)
            {
                return std::nullopt;
            }
            if (sv[4] != '.' || sv[7] != '.' || sv[10] != '-' ||
                sv[13] != '.' || sv[16] != '.' || sv[19] != ':')
            {
                return std::nullopt;
            }

            const auto year   = parseDigits(sv.substr(0, 4));
            const auto month  = parseDigits(sv.substr(5, 2));
            const auto day    = parseDigits(sv.substr(8, 2));
            const auto hour   = parseDigits(sv.substr(11, 2));
            const auto minute = parseDigits(sv.substr(14, 2));
            const auto second = parseDigits(sv.substr(17, 2));
            const auto millis = parseDigits(sv.substr(20));

            if (!year || !month || !day || !hour || !minute || !second || !millis)
            {
                return std::nullopt;
            }
            if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
                *hour > 23 || *minute > 59 || *second > 60)
            {
                return std::nullopt;
            }

            const std::int64_t days = daysFromCivil(*year, *month, *day);
            const std::int64_t secs = days * 86400 + *hour * 3600 + *minute * 60 + *second;
            return fromMillisSinceEpoch(secs * 1000 + *millis);
        }

        // -------- Epoch conversions --------

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept
        {
            const auto ms = std::chrono::time_point_cast<milliseconds>(tp)
                            .time_since_epoch();
            return static_cast<std::int64_t>(ms.count());
        }

        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept
        {
            return TimePoint(std::chrono::duration_cast<Clock::duration>(milliseconds(ms)));
        }

    } // namespace Utils
} // namespace StatTrack
