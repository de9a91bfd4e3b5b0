#include "loglens/utils/TimeUtils.hpp"
#include "loglens/utils/StringUtils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace LogLens
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            gmtime_s(&tm_buf, &t);
        #else
            gmtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        std::string toIso8601(TimePoint tp)
        {
            return formatTimestamp(tp, "%Y-%m-%dT%H:%M:%SZ");
        }

        // -------- Parsing helpers --------

        namespace
        {
            // Fixed-width numeric field; nullopt on any non-digit.
            std::optional<int> parseIntField(std::string_view sv)
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

            std::time_t utcToTimeT(std::tm &tm_buf)
            {
            #if defined(_WIN32)
                return _mkgmtime(&tm_buf);
            #else
                return timegm(&tm_buf);
            #endif
            }
        } // anonymous namespace

        std::optional<TimePoint> parseTimestamp(std::string_view sv)
        {
            sv = trim(sv);
            if (sv.size() < 19)
            {
                return std::nullopt;
            }
            if (sv[4] != '-' || sv[7] != '-' || (sv[10] != ' ' && sv[10] != 'T') ||
                sv[13] != ':' || sv[16] != ':')
            {
                return std::nullopt;
            }

            const auto year  = parseIntField(sv.substr(0, 4));
            const auto month = parseIntField(sv.substr(5, 2));
            const auto day   = parseIntField(sv.substr(8, 2));
            const auto hour  = parseIntField(sv.substr(11, 2));
            const auto min   = parseIntField(sv.substr(14, 2));
            const auto sec   = parseIntField(sv.substr(17, 2));
            if (!year || !month || !day || !hour || !min || !sec)
            {
                return std::nullopt;
            }
            if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
                *hour > 23 || *min > 59 || *sec > 60)
            {
                return std::nullopt;
            }

            int millis = 0;
            std::string_view rest = sv.substr(19);
            if (!rest.empty() && rest.front() == '.')
            {
                rest.remove_prefix(1);
                std::size_t digits = 0;
                while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9')
                {
                    ++digits;
                }
                if (digits == 0)
                {
                    return std::nullopt;
                }
                // Keep millisecond precision; extra digits are truncated.
                std::string frac(rest.substr(0, std::min<std::size_t>(digits, 3)));
                while (frac.size() < 3)
                {
                    frac.push_back('0');
                }
                millis = *parseIntField(frac);
                rest.remove_prefix(digits);
            }
            if (rest == "Z")
            {
                rest = {};
            }
            if (!rest.empty())
            {
                return std::nullopt;
            }

            std::tm tm_buf{};
            tm_buf.tm_year = *year - 1900;
            tm_buf.tm_mon  = *month - 1;
            tm_buf.tm_mday = *day;
            tm_buf.tm_hour = *hour;
            tm_buf.tm_min  = *min;
            tm_buf.tm_sec  = *sec;

            const std::time_t t = utcToTimeT(tm_buf);
            if (t == static_cast<std::time_t>(-1))
            {
                return std::nullopt;
            }
            return Clock::from_time_t(t) + milliseconds(millis);
        }

        // -------- Epoch conversions and differences --------

        double toEpochSeconds(TimePoint tp) noexcept
        {
            return static_cast<double>(toMillisSinceEpoch(tp)) / 1000.0;
        }

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept
        {
            const auto ms = std::chrono::time_point_cast<milliseconds>(tp).time_since_epoch();
            return static_cast<std::int64_t>(ms.count());
        }

        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept
        {
            return TimePoint(milliseconds(ms));
        }

        double elapsedSeconds(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration<double>(end - start).count();
        }

        // -------- Durations --------

        std::optional<Duration> parseDuration(std::string_view sv)
        {
            sv = trim(sv);
            std::size_t digits = 0;
            while (digits < sv.size() && sv[digits] >= '0' && sv[digits] <= '9')
            {
                ++digits;
            }
            if (digits == 0 || digits == sv.size())
            {
                return std::nullopt;
            }

            const auto amount = parseInt64(sv.substr(0, digits));
            if (!amount || *amount <= 0)
            {
                return std::nullopt;
            }

            const std::string unit = toLower(sv.substr(digits));
            if (unit == "ms")
                return milliseconds(*amount);
            if (unit == "s")
                return std::chrono::duration_cast<Duration>(seconds(*amount));
            if (unit == "m")
                return std::chrono::duration_cast<Duration>(std::chrono::minutes(*amount));
            if (unit == "h")
                return std::chrono::duration_cast<Duration>(std::chrono::hours(*amount));
            if (unit == "d")
                return std::chrono::duration_cast<Duration>(std::chrono::hours(24 * *amount));

            return std::nullopt;
        }

        std::string formatDuration(Duration d)
        {
            const auto ms = d.count();
            if (ms % 86400000 == 0)
                return std::to_string(ms / 86400000) + "d";
            if (ms % 3600000 == 0)
                return std::to_string(ms / 3600000) + "h";
            if (ms % 60000 == 0)
                return std::to_string(ms / 60000) + "m";
            if (ms % 1000 == 0)
                return std::to_string(ms / 1000) + "s";
            return std::to_string(ms) + "ms";
        }

    } // namespace Utils
} // namespace LogLens
