#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace LogLens
{
    namespace Utils
    {
        /**
         * Time utilities shared by the event model, the window engine and the
         * ingestion layer.
         *
         * Design notes:
         *  - Event time is wall-clock time, so everything is expressed with
         *    std::chrono::system_clock.
         *  - All textual conversions use UTC so that window alignment and
         *    reports do not depend on the host timezone.
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using Duration     = std::chrono::milliseconds;
        using milliseconds = std::chrono::milliseconds;
        using seconds      = std::chrono::seconds;

        /// Wall-clock time, used for diagnostics only; windows run on event time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint (UTC) into a human-readable timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// ISO-8601 UTC string: "YYYY-MM-DDTHH:MM:SSZ".
        std::string toIso8601(TimePoint tp);

        /**
         * Parse "YYYY-MM-DD HH:MM:SS" (or with a 'T' separator), optionally
         * followed by ".mmm" fractional milliseconds. Interpreted as UTC.
         */
        std::optional<TimePoint> parseTimestamp(std::string_view sv);

        /// Seconds since epoch as a floating point number (millisecond precision).
        double toEpochSeconds(TimePoint tp) noexcept;

        std::int64_t toMillisSinceEpoch(TimePoint tp) noexcept;
        TimePoint fromMillisSinceEpoch(std::int64_t ms) noexcept;

        /// Elapsed time between two points, in fractional seconds.
        double elapsedSeconds(TimePoint start, TimePoint end) noexcept;

        /**
         * Parse a window duration such as "30s", "5m", "1h", "2d" or "250ms".
         *
         * Units are case-insensitive. Returns std::nullopt for malformed,
         * zero or negative durations.
         */
        std::optional<Duration> parseDuration(std::string_view sv);

        /// Render a duration in the most compact unit that represents it exactly ("5m", "90s").
        std::string formatDuration(Duration d);

    } // namespace Utils
} // namespace LogLens
