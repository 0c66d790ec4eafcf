#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

#include "stats/MemoryStatsStore.hpp"

namespace StatTrack
{
    namespace Stats
    {
        /**
         * FileStatsStore
         *
         * Responsibilities:
         *  - Persist every accepted mutation as one line of an append-only
         *    journal and rebuild the tables from it at startup.
         *
         * Journal format (one record per line, '|' separated, fields
         * escaped with Utils::escapeField):
         *   O|<match fields>            match opened
         *   C|<match fields>            match closed
         *   U|<match fields>|<state>    round progress of an open match
         *   S|<session fields>          session opened
         *   E|<session fields>          session ended
         *   P|<delta fields>            per-match delta
         *   A|<delta fields>            all-time delta
         * match fields: id|server|map|scenario|lighting|startMs|endMs|
         *               roundNumber|roundsPlayed|winningTeam|gameOver
         * session fields: matchId|server|identity|displayName|joinedMs|
         *                 leftMs|team
         * delta fields: key|matchId|identity|displayName|metric|weapon|
         *               amount|outOfRound
         *
         * Design notes:
         *  - Duplicates are detected against the in-memory tables before
         *    anything is written, so the journal holds each key once.
         *  - The journal is never compacted. It grows with the number of
         *    stat deltas, sessions and matches ever recorded.
         *  - A final line without its terminator is a torn write from a
         *    crash: it is dropped and cut off the file at startup. Other
         *    unreadable lines are skipped with a warning.
         *  - flush() pushes buffered records to the OS; a failed write is
         *    reported as UpsertResult::Failed and leaves the tables as they
         *    were, so the caller can retry.
         */
        class FileStatsStore : public StatsStore
        {
        public:
            /// Open (or create) the journal and replay it. Throws StoreError if it cannot be opened.
            explicit FileStatsStore(std::string journalPath);

            FileStatsStore(const FileStatsStore &)            = delete;
            FileStatsStore &operator=(const FileStatsStore &) = delete;

            ~FileStatsStore() override;

            UpsertResult openMatch(const Core::MatchRecord &match) override;
            UpsertResult closeMatch(const Core::MatchRecord &match) override;
            UpsertResult saveMatchProgress(const Core::MatchRecord &match) override;

            UpsertResult openSession(const Core::PlayerSession &session) override;
            UpsertResult closeSession(const Core::PlayerSession &session) override;

            UpsertResult upsertPlayerMatchStats(const Core::StatDelta &delta) override;
            UpsertResult upsertAllTimeStats(const Core::StatDelta &delta) override;

            bool flush() override;

            std::optional<Core::MatchRecord> match(const std::string &matchId) const override;
            std::vector<Core::MatchRecord> matches() const override;
            std::optional<Core::MatchRecord> activeMatch(const std::string &serverId) const override;
            std::vector<Core::PlayerSession> sessions(const std::string &matchId) const override;

            std::optional<Core::PlayerMatchStats> playerMatchStats(const std::string &matchId,
                                                                   const std::string &identity) const override;
            std::vector<Core::PlayerMatchStats> matchStats(const std::string &matchId) const override;

            std::optional<Core::PlayerMatchStats> allTimeStats(const std::string &identity) const override;
            std::vector<Core::PlayerMatchStats> allTime() const override;

            const std::string &path() const noexcept { return m_path; }

            /// Records replayed at startup, and lines skipped as unreadable or torn.
            std::size_t replayedRecords() const noexcept { return m_replayed; }
            std::size_t skippedRecords() const noexcept { return m_skipped; }

            static std::string encodeMatch(char tag, const Core::MatchRecord &match);
            static std::string encodeDelta(char tag, const Core::StatDelta &delta);
            static std::string encodeSession(char tag, const Core::PlayerSession &session);

        private:
            void replay();
            bool applyRecord(std::string_view line);
            bool append(const std::string &record);

        private:
            std::string      m_path;
            MemoryStatsStore m_tables;
            std::ofstream    m_out;
            std::mutex       m_writeMutex;  // check + append + apply as one step
            std::size_t      m_replayed = 0;
            std::size_t      m_skipped  = 0;
        };

    } // namespace Stats
} // namespace StatTrack
