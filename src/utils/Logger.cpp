#include "utils/Logger.hpp"

#include <iostream>

#include "utils/StringUtils.hpp"

namespace StatTrack
{
    namespace Utils
    {
        LogLevel parseLogLevel(std::string_view value) noexcept
        {
            const std::string_view v = trim(value);
            if (iequals(v, "trace"))
                return LogLevel::TRACE;
            if (iequals(v, "debug"))
                return LogLevel::DEBUG;
            if (iequals(v, "info"))
                return LogLevel::INFO;
            if (iequals(v, "warn") || iequals(v, "warning"))
                return LogLevel::WARN;
            if (iequals(v, "error"))
                return LogLevel::ERROR;
            if (iequals(v, "critical") || iequals(v, "fatal"))
                return LogLevel::CRITICAL;
            return LogLevel::INFO;
        }

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_file(),
              m_fileEnabled(false),
              m_consoleEnabled(true),
              m_console(&std::cerr)
        {
        }

        Logger::Logger(std::string_view filePath, LogLevel level)
            : m_level(level),
              m_file(),
              m_fileEnabled(false),
              m_consoleEnabled(true),
              m_console(&std::cerr)
        {
            if (!filePath.empty())
            {
                openFile(filePath);
            }
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
            {
                m_file.flush();
                m_file.close();
            }
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_level = level;
        }

        LogLevel Logger::level() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<int>(level) >= static_cast<int>(m_level);
        }

        bool Logger::openFile(std::string_view filePath)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_file.is_open())
            {
                m_file.close();
            }
            m_fileEnabled = false;

            m_file.open(std::string(filePath), std::ios::out | std::ios::app);
            if (m_file.is_open())
            {
                m_fileEnabled = true;
            }
            return m_fileEnabled;
        }

        void Logger::setConsoleEnabled(bool enabled) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_consoleEnabled = enabled;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (static_cast<int>(level) < static_cast<int>(m_level))
                {
                    return;
                }
            }

            // "[timestamp] [LEVEL] message"
            const TimePoint ts = now();
            const std::string tsStr = formatTimestamp(ts, "%Y-%m-%d %H:%M:%S");
            const char *levelStr = toString(level);

            std::string line;
            line.reserve(tsStr.size() + message.size() + 16);
            line.append("[");
            line.append(tsStr);
            line.append("] [");
            line.append(levelStr);
            line.append("] ");
            line.append(message);

            writeLine(line);
        }

        const char *Logger::toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        void Logger::writeLine(std::string_view line)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_consoleEnabled && m_console)
            {
                (*m_console) << line << '\n';
                m_console->flush();
            }

            if (m_fileEnabled && m_file.is_open())
            {
                m_file << line << '\n';
                m_file.flush();
            }
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace StatTrack
