#include "loglens/utils/StringUtils.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace LogLens
{
    namespace Utils
    {
        namespace
        {
            bool isSpace(char c) noexcept
            {
                return std::isspace(static_cast<unsigned char>(c)) != 0;
            }

            char lowerAscii(char c) noexcept
            {
                return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }

            // strtoll/strtod need a terminated buffer; reject leading '+' forms
            // and hex so the grammar stays "optional '-', digits, '.', exponent".
            bool plainNumber(const std::string &s, bool allowFraction)
            {
                if (s.empty())
                    return false;
                std::size_t i = (s[0] == '-') ? 1 : 0;
                bool digit = false;
                for (; i < s.size(); ++i)
                {
                    const char c = s[i];
                    if (c >= '0' && c <= '9')
                        digit = true;
                    else if (!allowFraction)
                        return false;
                    else if (c != '.' && c != 'e' && c != 'E' && c != '-' && c != '+')
                        return false;
                }
                return digit;
            }
        } // anonymous namespace

        std::string_view ltrim(std::string_view sv) noexcept
        {
            std::size_t i = 0;
            while (i < sv.size() && isSpace(sv[i]))
                ++i;
            return sv.substr(i);
        }

        std::string_view rtrim(std::string_view sv) noexcept
        {
            std::size_t n = sv.size();
            while (n > 0 && isSpace(sv[n - 1]))
                --n;
            return sv.substr(0, n);
        }

        std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        std::string toLower(std::string_view sv)
        {
            std::string out(sv);
            for (char &c : out)
                c = lowerAscii(c);
            return out;
        }

        std::string toUpper(std::string_view sv)
        {
            std::string out(sv);
            for (char &c : out)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return out;
        }

        bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
                return false;
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                if (lowerAscii(a[i]) != lowerAscii(b[i]))
                    return false;
            }
            return true;
        }

        std::vector<std::string_view> split(std::string_view sv, char delimiter, bool keepEmpty)
        {
            std::vector<std::string_view> fields;
            std::size_t begin = 0;
            for (;;)
            {
                const std::size_t at = sv.find(delimiter, begin);
                const std::string_view field =
                    sv.substr(begin, at == std::string_view::npos ? std::string_view::npos : at - begin);
                if (keepEmpty || !field.empty())
                    fields.push_back(field);
                if (at == std::string_view::npos)
                    break;
                begin = at + 1;
            }
            return fields;
        }

        std::optional<std::int64_t> parseInt64(std::string_view sv)
        {
            const std::string text(trim(sv));
            if (!plainNumber(text, false))
                return std::nullopt;

            errno = 0;
            char *end = nullptr;
            const long long value = std::strtoll(text.c_str(), &end, 10);
            if (errno == ERANGE || end != text.c_str() + text.size())
                return std::nullopt;
            return static_cast<std::int64_t>(value);
        }

        std::optional<double> parseDouble(std::string_view sv)
        {
            const std::string text(trim(sv));
            if (!plainNumber(text, true))
                return std::nullopt;

            errno = 0;
            char *end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (errno == ERANGE || end != text.c_str() + text.size() || !std::isfinite(value))
                return std::nullopt;
            return value;
        }

        std::optional<bool> parseBool(std::string_view sv)
        {
            static constexpr std::string_view kTrue[]  = {"1", "true", "yes", "on"};
            static constexpr std::string_view kFalse[] = {"0", "false", "no", "off"};

            sv = trim(sv);
            for (auto word : kTrue)
            {
                if (iequals(sv, word))
                    return true;
            }
            for (auto word : kFalse)
            {
                if (iequals(sv, word))
                    return false;
            }
            return std::nullopt;
        }

        std::string formatNumber(double value)
        {
            if (std::isnan(value))
                return "nan";
            if (std::isinf(value))
                return value > 0 ? "inf" : "-inf";

            std::ostringstream oss;
            if (std::fabs(value) < 1e15 && value == std::floor(value))
                oss << static_cast<long long>(value);
            else
                oss << std::setprecision(10) << value;
            return oss.str();
        }

        std::string escapeCsv(std::string_view s)
        {
            if (s.find_first_of(",\"\r\n") == std::string_view::npos)
                return std::string(s);

            std::string out;
            out.reserve(s.size() + 4);
            out += '"';
            for (char c : s)
            {
                if (c == '"')
                    out += '"';
                out += c;
            }
            out += '"';
            return out;
        }

    } // namespace Utils
} // namespace LogLens
