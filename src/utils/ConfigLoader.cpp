#include "loglens/utils/ConfigLoader.hpp"
#include "loglens/utils/Logger.hpp"
#include "loglens/utils/StringUtils.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace LogLens
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                getLogger().error("Cannot open configuration file '" + filePath + "'");
                return false;
            }

            std::ostringstream buffer;
            buffer << in.rdbuf();
            loadFromString(buffer.str());
            return true;
        }

        void ConfigLoader::loadFromString(std::string_view text)
        {
            std::map<std::string, std::string, std::less<>> newValues;
            std::size_t malformed = 0;

            std::size_t lineNumber = 0;
            std::size_t entryLine = 0;
            std::string pending;   // logical line being assembled from continuations

            auto commit = [&]() {
                const std::string_view entry = trim(pending);
                const auto pos = entry.find('=');
                const std::string_view key = pos == std::string_view::npos ? std::string_view{}
                                                                           : trim(entry.substr(0, pos));
                if (key.empty())
                {
                    ++malformed;
                    getLogger().warn("config line " + std::to_string(entryLine) + ": expected 'key = value'");
                }
                else
                {
                    // Last occurrence wins if key is repeated.
                    newValues[std::string(key)] = std::string(trim(entry.substr(pos + 1)));
                }
                pending.clear();
            };

            for (std::string_view line : split(text, '\n', true))
            {
                ++lineNumber;
                std::string_view stripped = trim(line);

                if (pending.empty())
                {
                    if (stripped.empty() || stripped.front() == '#' || stripped.front() == ';')
                    {
                        continue;
                    }
                    entryLine = lineNumber;
                }

                // A trailing backslash continues the entry on the next line.
                const bool continues = !stripped.empty() && stripped.back() == '\\';
                if (continues)
                {
                    stripped.remove_suffix(1);
                }
                if (!pending.empty())
                {
                    pending += ' ';
                }
                pending += trim(stripped);

                if (!continues)
                {
                    commit();
                }
            }
            if (!pending.empty())
            {
                commit();
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values    = std::move(newValues);
            m_malformed = malformed;
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(key) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(key);
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<long long> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseInt64(*v);
        }

        long long ConfigLoader::getIntOr(std::string_view key, long long defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseDouble(*v);
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseBool(*v);
        }

        std::vector<std::string> ConfigLoader::sectionNames(std::string_view prefix) const
        {
            const std::string lead = std::string(prefix) + ".";
            std::set<std::string> names;

            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto &[key, value] : m_values)
            {
                if (!startsWith(key, lead))
                {
                    continue;
                }
                const std::string_view rest = std::string_view(key).substr(lead.size());
                const auto dot = rest.rfind('.');
                if (dot == std::string_view::npos || dot == 0)
                {
                    continue;
                }
                // The attribute is the last segment, so names may themselves contain dots.
                names.emplace(rest.substr(0, dot));
            }
            return {names.begin(), names.end()};
        }

        std::size_t ConfigLoader::malformedLines() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_malformed;
        }

        std::map<std::string, std::string> ConfigLoader::all() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return {m_values.begin(), m_values.end()};
        }

    } // namespace Utils
} // namespace LogLens
