#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "core/LogCursor.hpp"

namespace StatTrack
{
    namespace Input
    {
        enum class TailStatus
        {
            Ok,       ///< At least one new line.
            NoData,   ///< File is there, nothing new.
            Missing,  ///< Watched path does not exist (yet).
            IoError,  ///< Permission or unexpected read failure.
        };

        const char *toString(TailStatus status) noexcept;

        struct TailResult
        {
            TailStatus                 status = TailStatus::NoData;
            std::vector<Core::RawLine> lines;
            bool                       rotated = false;  ///< A new file identity was adopted.
            std::string                error;
        };

        /**
         * LogTailer
         *
         * Responsibilities:
         *  - Incrementally read one growing log file and hand out complete
         *    lines in file order, each with its byte range.
         *  - Resume from a persisted LogCursor without loss or duplication.
         *  - Detect rotation (rename / recreate), truncation and a missing
         *    file, and keep watching the same logical path across them.
         *
         * Design notes:
         *  - A file is identified by "<device>:<inode>". When the same inode
         *    is truncated and refilled the identity gains a generation suffix
         *    ("<device>:<inode>#<n>") so line keys of the new content never
         *    collide with keys of the old content.
         *  - On resume the last consumed line is re-read and its checksum
         *    compared; any mismatch is handled as a truncation.
         *  - On rename the old stream is drained before the new file is
         *    opened; a final unterminated line of the old file is emitted.
         *  - A trailing partial line is buffered until its terminator arrives.
         *  - Pure polling: no OS notification is needed for correctness.
         *  - Single-threaded ownership; one instance per watched file.
         */
        class LogTailer
        {
        public:
            struct FileStat
            {
                std::string   identity;  ///< "<device>:<inode>".
                std::uint64_t size = 0;
            };

            /**
             * @param maxBytesPerPoll upper bound of bytes read by one poll(),
             *        so a large backlog is handed out in slices.
             */
            LogTailer(std::string serverId, std::string path,
                      std::size_t maxBytesPerPoll = 1024 * 1024);

            LogTailer(const LogTailer &)            = delete;
            LogTailer &operator=(const LogTailer &) = delete;

            ~LogTailer();

            /**
             * Start watching, resuming from a persisted cursor when given.
             *
             * Returns true if the file could be opened now. A false return is
             * not fatal: poll() keeps trying to open the path.
             */
            bool open(const std::optional<Core::LogCursor> &cursor);

            /// Read everything appended since the last call (bounded by maxBytesPerPoll).
            TailResult poll();

            void close() noexcept;

            bool isOpen() const noexcept;

            /// Position right after the last line handed out.
            const Core::LogCursor &cursor() const noexcept { return m_cursor; }

            const std::string &serverId() const noexcept { return m_serverId; }
            const std::string &path() const noexcept { return m_path; }

            /// Number of rotations / truncations detected so far.
            std::uint64_t rotations() const noexcept { return m_rotations; }

            /**
             * Stat a path.
             * Returns std::nullopt if it cannot be stat'ed; errOut receives a
             * message unless the path simply does not exist.
             */
            static std::optional<FileStat> statPath(const std::string &path,
                                                    std::string *errOut = nullptr);

            /// "<device>:<inode>#<n>" -> "<device>:<inode>".
            static std::string baseIdentity(const std::string &fileIdentity);

            /// Next truncation generation of an identity.
            static std::string nextGeneration(const std::string &fileIdentity);

        private:
            enum class OpenOutcome
            {
                Opened,
                Missing,
                Failed,
            };

            OpenOutcome openFile(TailResult &result);
            bool verifyLastLine(const Core::LogCursor &cursor) const;
            void readAvailable(TailResult &result, bool unbounded);
            void emitCompleteLines(TailResult &result);
            void emitPartialLine(TailResult &result);
            void finish(TailResult &result, TailStatus emptyStatus) const;

        private:
            std::string       m_serverId;
            std::string       m_path;
            std::size_t       m_maxBytesPerPoll;

            std::ifstream     m_stream;        // RAII-managed, binary mode
            std::string       m_openBase;      // base identity of m_stream
            Core::LogCursor   m_cursor;        // end of the last emitted line
            std::uint64_t     m_readOffset = 0; // bytes pulled into m_pending
            std::string       m_pending;       // bytes after m_cursor.byteOffset
            std::vector<char> m_buffer;
            std::uint64_t     m_rotations = 0;
        };

    } // namespace Input
} // namespace StatTrack
