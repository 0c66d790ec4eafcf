#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <ostream>

#include "utils/TimeUtils.hpp"  // for TimePoint and formatting

namespace StatTrack
{
    namespace Utils
    {
        /**
         * Log severity levels used across the engine.
         *
         * Typical usage:
         *  - TRACE: per-line parser and tracker decisions
         *  - DEBUG: per-poll / per-query details
         *  - INFO: lifecycle (server started, match opened, rotation detected)
         *  - WARN: recoverable problems (missing file, unreachable server)
         *  - ERROR: I/O failures that will be retried
         *  - CRITICAL: cursor or aggregates cannot be persisted
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /**
         * Map a configuration value ("debug", "WARNING", ...) to a LogLevel.
         * Unknown values fall back to INFO.
         */
        LogLevel parseLogLevel(std::string_view value) noexcept;

        /**
         * Logger
         *
         * Thread-safe logging facility shared by every tailer, poller and
         * tracker thread.
         *
         * Features:
         *  - Global log level filtering.
         *  - Optional log file in addition to stderr.
         *  - Timestamps on every message.
         *
         * This class is non-copyable and intended to be used through
         * getLogger().
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger attempts to open the file
             * in append mode. If opening fails, logging falls back to stderr.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Attach (or replace) the file sink.
             * Returns false if the file cannot be opened; stderr keeps working.
             */
            bool openFile(std::string_view filePath);

            /// Silence the stderr sink (tests keep their output clean this way).
            void setConsoleEnabled(bool enabled) noexcept;

            /**
             * Log a message with a given severity.
             *
             * The log entry includes:
             *   - Timestamp (using TimeUtils)
             *   - Log level
             *   - Message text
             */
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            static const char *toString(LogLevel level) noexcept;

            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            bool                            m_consoleEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

        /**
         * Process-wide logger (stderr, INFO until configured).
         *
         *   Logger &log = getLogger();
         *   log.info("Tailer started for " + serverId);
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace StatTrack
