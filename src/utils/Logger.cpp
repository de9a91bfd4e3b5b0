#include "loglens/utils/Logger.hpp"

#include <iostream>

#include "loglens/utils/StringUtils.hpp"
#include "loglens/utils/TimeUtils.hpp"

namespace LogLens
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view name)
        {
            struct Alias
            {
                std::string_view text;
                LogLevel         level;
            };
            static constexpr Alias kAliases[] = {
                {"trace", LogLevel::TRACE},
                {"debug", LogLevel::DEBUG},
                {"info", LogLevel::INFO},
                {"warn", LogLevel::WARN},
                {"warning", LogLevel::WARN},
                {"error", LogLevel::ERROR},
                {"critical", LogLevel::CRITICAL},
                {"fatal", LogLevel::CRITICAL},
                {"off", LogLevel::OFF},
                {"none", LogLevel::OFF},
            };

            name = trim(name);
            for (const auto &alias : kAliases)
            {
                if (iequals(name, alias.text))
                {
                    return alias.level;
                }
            }
            return std::nullopt;
        }

        const char *toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            case LogLevel::OFF:      return "OFF";
            }
            return "UNKNOWN";
        }

        Logger::Logger()
            : m_console(&std::cerr)
        {
        }

        bool Logger::setFile(std::string_view filePath)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            m_file.close();
            m_file.clear();
            if (filePath.empty())
            {
                return true;
            }
            m_file.open(std::string(filePath), std::ios::out | std::ios::app);
            return m_file.is_open();
        }

        void Logger::setConsole(std::ostream *console)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
            {
                return;
            }

            std::string line = "[" + formatTimestamp(now()) + "] [" + toString(level) + "] ";
            line.append(message);
            line.push_back('\n');

            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (m_console)
            {
                *m_console << line << std::flush;
            }
            if (m_file.is_open())
            {
                m_file << line << std::flush;
            }
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace LogLens
