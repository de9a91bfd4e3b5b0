#include "loglens/input/LineParser.hpp"

#include <cctype>
#include <vector>

#include "loglens/utils/Logger.hpp"
#include "loglens/utils/StringUtils.hpp"
#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
    namespace Input
    {
        namespace
        {
            struct Token
            {
                std::string_view text;
                std::size_t      offset;
            };

            // Whitespace tokenizer that keeps quoted runs together.
            std::vector<Token> tokenize(std::string_view sv)
            {
                std::vector<Token> tokens;
                std::size_t i = 0;
                while (i < sv.size())
                {
                    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i])))
                    {
                        ++i;
                    }
                    if (i >= sv.size())
                    {
                        break;
                    }
                    const std::size_t start = i;
                    char quote = 0;
                    while (i < sv.size())
                    {
                        const char c = sv[i];
                        if (quote)
                        {
                            if (c == quote)
                            {
                                quote = 0;
                            }
                        }
                        else if (c == '"' || c == '\'')
                        {
                            quote = c;
                        }
                        else if (std::isspace(static_cast<unsigned char>(c)))
                        {
                            break;
                        }
                        ++i;
                    }
                    tokens.push_back({sv.substr(start, i - start), start});
                }
                return tokens;
            }

            bool isKeyChar(char c)
            {
                return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
            }

            // "key=value" with a non-empty identifier-like key.
            std::optional<std::size_t> keyValueSplit(std::string_view token)
            {
                const auto eq = token.find('=');
                if (eq == std::string_view::npos || eq == 0)
                {
                    return std::nullopt;
                }
                for (std::size_t i = 0; i < eq; ++i)
                {
                    if (!isKeyChar(token[i]))
                    {
                        return std::nullopt;
                    }
                }
                return eq;
            }

            std::string_view unquote(std::string_view sv)
            {
                if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') && sv.back() == sv.front())
                {
                    return sv.substr(1, sv.size() - 2);
                }
                return sv;
            }
        } // anonymous namespace

        Core::MetadataValue LineParser::parseValue(std::string_view text)
        {
            const bool quoted = text.size() >= 2 && (text.front() == '"' || text.front() == '\'') &&
                                text.back() == text.front();
            if (quoted)
            {
                return Core::MetadataValue(std::string(unquote(text)));
            }
            if (auto i = Utils::parseInt64(text))
            {
                return Core::MetadataValue(*i);
            }
            if (auto d = Utils::parseDouble(text))
            {
                return Core::MetadataValue(*d);
            }
            if (Utils::iequals(text, "true"))
            {
                return Core::MetadataValue(true);
            }
            if (Utils::iequals(text, "false"))
            {
                return Core::MetadataValue(false);
            }
            return Core::MetadataValue(std::string(text));
        }

        std::optional<Core::Event> LineParser::parseLine(std::string_view line) const
        {
            return parseLineDetailed(line).event;
        }

        LineParser::ParseResult LineParser::parseLineDetailed(std::string_view line) const
        {
            ParseResult result;
            std::string_view rest = Utils::trim(line);
            if (rest.empty())
            {
                result.blank = true;
                return result;
            }

            // Timestamp: date and time tokens, or a single 'T'-joined token.
            std::size_t tsEnd = rest.find(' ');
            if (tsEnd != std::string_view::npos && rest.find('T') != 10)
            {
                tsEnd = rest.find(' ', tsEnd + 1);
            }
            const auto tsText = rest.substr(0, tsEnd == std::string_view::npos ? rest.size() : tsEnd);
            const auto timestamp = Utils::parseTimestamp(tsText);
            if (!timestamp)
            {
                result.error = "invalid timestamp";
                return result;
            }
            rest = Utils::ltrim(rest.substr(tsText.size()));

            const auto levelEnd = rest.find(' ');
            const auto levelText = rest.substr(0, levelEnd == std::string_view::npos ? rest.size() : levelEnd);
            const auto level = Core::parseEventLevel(levelText);
            if (level == Core::EventLevel::Unknown)
            {
                result.error = "unknown level '" + std::string(levelText) + "'";
                return result;
            }
            rest = Utils::ltrim(rest.substr(levelText.size()));

            std::string source;
            const auto sourceEnd = rest.find(' ');
            const auto firstWord = rest.substr(0, sourceEnd == std::string_view::npos ? rest.size() : sourceEnd);
            if (firstWord.size() > 1 && firstWord.back() == ':')
            {
                source = std::string(firstWord.substr(0, firstWord.size() - 1));
                rest = Utils::ltrim(rest.substr(firstWord.size()));
            }

            // Trailing run of key=value tokens is metadata; the rest is the message.
            const auto tokens = tokenize(rest);
            std::size_t firstMeta = tokens.size();
            while (firstMeta > 0 && keyValueSplit(tokens[firstMeta - 1].text))
            {
                --firstMeta;
            }

            Core::Metadata metadata;
            for (std::size_t i = firstMeta; i < tokens.size(); ++i)
            {
                const auto token = tokens[i].text;
                const auto eq = *keyValueSplit(token);
                metadata.insert_or_assign(std::string(token.substr(0, eq)), parseValue(token.substr(eq + 1)));
            }

            const std::string_view message =
                firstMeta < tokens.size() ? Utils::rtrim(rest.substr(0, tokens[firstMeta].offset)) : rest;

            result.event.emplace(*timestamp, level, std::move(source), std::string(message), std::move(metadata));
            return result;
        }

        LineParser::ReadStatistics LineParser::readAll(FileReader &reader, const EventCallback &onEvent) const
        {
            ReadStatistics stats;
            while (auto line = reader.nextLine())
            {
                ++stats.lines;
                auto parsed = parseLineDetailed(*line);
                if (parsed.event)
                {
                    ++stats.events;
                    onEvent(std::move(*parsed.event));
                }
                else if (!parsed.blank)
                {
                    ++stats.malformed;
                    Utils::getLogger().debug(reader.filePath() + ":" + std::to_string(reader.lineNumber()) +
                                             ": skipped malformed line (" + parsed.error + ")");
                }
            }
            return stats;
        }

    } // namespace Input
} // namespace LogLens
