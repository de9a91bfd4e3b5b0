#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LogLens
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration (key = value format) from a file or a string.
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored; whitespace around key and value is trimmed.
         *  - A trailing '\' joins the next line to the entry (long filters).
         *  - Malformed entries (no '=' or empty key) are skipped, counted and
         *    logged with their line number.
         *
         * Example:
         *   log_level                    = INFO
         *   metric.error_count.filter    = level in ('ERROR', 'CRITICAL')
         *   metric.error_count.window    = 5m
         *
         * There is no global instance: the loader is built by the caller and
         * handed to whatever needs it.
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened.
             * Loaded keys replace any previous content.
             */
            bool loadFromFile(const std::string &filePath);

            /// Parse configuration text; same rules as loadFromFile.
            void loadFromString(std::string_view text);

            /// Set or override a single key.
            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key, std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not an integer.
            std::optional<long long> getInt(std::string_view key) const;
            long long getIntOr(std::string_view key, long long defaultValue) const;

            std::optional<double> getDouble(std::string_view key) const;

            /// Boolean value; accepts 1/0, true/false, yes/no, on/off.
            std::optional<bool> getBool(std::string_view key) const;

            /**
             * Distinct second-level names under a prefix, in sorted order.
             *
             * For keys "metric.a.window" and "metric.b.filter",
             * sectionNames("metric") returns {"a", "b"}.
             */
            std::vector<std::string> sectionNames(std::string_view prefix) const;

            /// Number of lines skipped as malformed during the last load.
            std::size_t malformedLines() const;

            /// Snapshot of every key (sorted).
            std::map<std::string, std::string> all() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::map<std::string, std::string, std::less<>> m_values;
            std::size_t m_malformed = 0;

            // Protects m_values for readers on other threads.
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace LogLens
