#pragma once

#include <optional>
#include <string>

#include "core/LogCursor.hpp"

namespace StatTrack
{
    namespace Input
    {
        /**
         * CursorStore
         *
         * Responsibilities:
         *  - Persist one LogCursor per server under a state directory.
         *  - Load it back at startup so a tailer resumes where it stopped.
         *
         * Design notes:
         *  - Each cursor is a small "key = value" file read through
         *    Utils::ConfigLoader (<state_dir>/<server>.cursor).
         *  - Writes go to a temporary file that is renamed over the old one,
         *    so a crash leaves either the old or the new cursor on disk.
         *  - Only the owning tailer task writes a given server's cursor.
         */
        class CursorStore
        {
        public:
            explicit CursorStore(std::string stateDir);

            CursorStore(const CursorStore &)            = delete;
            CursorStore &operator=(const CursorStore &) = delete;

            /**
             * Load the cursor of a server.
             * Returns std::nullopt if none was saved or the file is unreadable.
             */
            std::optional<Core::LogCursor> load(const std::string &serverId) const;

            /**
             * Atomically replace the stored cursor.
             * Returns false (and logs) if the state directory or file cannot
             * be written.
             */
            bool save(const Core::LogCursor &cursor) const;

            /// Remove a stored cursor; missing files are not an error.
            bool remove(const std::string &serverId) const;

            /// Path of the cursor file used for a server.
            std::string pathFor(const std::string &serverId) const;

            const std::string &stateDir() const noexcept { return m_stateDir; }

        private:
            std::string m_stateDir;
        };

    } // namespace Input
} // namespace StatTrack
