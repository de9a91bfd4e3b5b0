#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace LogLens
{
    namespace Utils
    {
        /**
         * Severity of a diagnostic line.
         *
         *  - TRACE: per-event internals
         *  - DEBUG: late-event drops, group evictions, resets, skipped lines
         *  - INFO: component construction and run summaries
         *  - WARN: evaluation errors and detected anomalies
         *  - ERROR: an output or input that could not be opened
         *  - CRITICAL: the run is aborted
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
            OFF      = 6,
        };

        /// "debug", "WARN", "warning", "fatal", "off"...; nullopt for unknown names.
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        const char *toString(LogLevel level) noexcept;

        /**
         * Logger
         *
         * Diagnostic output of the engine. Lines look like
         *   [2024-01-01 10:00:00] [WARN] metric 'latency': ...
         * with the wall-clock time in UTC.
         *
         * Sinks: a console stream (stderr unless replaced) and an optional
         * log file opened in append mode. The level check is lock-free so
         * callers on the per-event path can test isEnabled() before building
         * a message; writes are serialized.
         */
        class Logger
        {
        public:
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            void setLevel(LogLevel level) noexcept { m_level.store(level, std::memory_order_relaxed); }
            LogLevel level() const noexcept { return m_level.load(std::memory_order_relaxed); }

            bool isEnabled(LogLevel level) const noexcept
            {
                const LogLevel threshold = this->level();
                return level != LogLevel::OFF && threshold != LogLevel::OFF &&
                       static_cast<int>(level) >= static_cast<int>(threshold);
            }

            /// Also write to filePath (append). An empty path stops file output.
            bool setFile(std::string_view filePath);

            /// Console sink; nullptr silences the console.
            void setConsole(std::ostream *console);

            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)    { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)    { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)     { log(LogLevel::INFO, message); }
            void warn(std::string_view message)     { log(LogLevel::WARN, message); }
            void error(std::string_view message)    { log(LogLevel::ERROR, message); }
            void critical(std::string_view message) { log(LogLevel::CRITICAL, message); }

        private:
            std::atomic<LogLevel> m_level{LogLevel::INFO};
            std::ostream         *m_console;
            std::ofstream         m_file;
            std::mutex            m_writeMutex;
        };

        /// The process-wide logger every component writes to.
        Logger &getLogger();

    } // namespace Utils
} // namespace LogLens
