#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LogLens
{
    namespace Utils
    {
        /**
         * Text helpers shared by the configuration loader, the line parser
         * and the expression lexer.
         *
         * Everything here is stateless. Views returned by the trimming and
         * splitting helpers point into the caller's buffer.
         */

        std::string_view ltrim(std::string_view sv) noexcept;
        std::string_view rtrim(std::string_view sv) noexcept;
        std::string_view trim(std::string_view sv) noexcept;

        std::string toLower(std::string_view sv);
        std::string toUpper(std::string_view sv);

        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.substr(0, prefix.size()) == prefix;
        }

        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size() && sv.substr(sv.size() - suffix.size()) == suffix;
        }

        /// ASCII case-insensitive comparison ("Error" == "ERROR").
        bool iequals(std::string_view a, std::string_view b) noexcept;

        /// Split on one character; empty fields are dropped unless keepEmpty.
        std::vector<std::string_view> split(std::string_view sv, char delimiter, bool keepEmpty = false);

        /**
         * Whole-string numeric parsing, surrounding whitespace allowed.
         *
         * std::nullopt when the text is empty, has trailing garbage, is out
         * of range, or (for doubles) spells inf or nan.
         */
        std::optional<std::int64_t> parseInt64(std::string_view sv);
        std::optional<double> parseDouble(std::string_view sv);

        /// 1/0, true/false, yes/no, on/off (case-insensitive).
        std::optional<bool> parseBool(std::string_view sv);

        /// Integral values without a fraction ("3"), others with up to 10 significant digits.
        std::string formatNumber(double value);

        /// RFC 4180 field escaping: quote when the field holds ',', '"', CR or LF.
        std::string escapeCsv(std::string_view s);

    } // namespace Utils
} // namespace LogLens
