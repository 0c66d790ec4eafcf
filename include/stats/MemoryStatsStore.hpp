#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_set>
#include <utility>

#include "stats/StatsStore.hpp"

namespace StatTrack
{
    namespace Stats
    {
        /**
         * MemoryStatsStore
         *
         * Responsibilities:
         *  - Keep match records, sessions, per-match rows and all-time rows
         *    in memory.
         *  - Remember every applied idempotency key, which makes re-applying
         *    a delta a no-op for the lifetime of the store.
         *
         * Design notes:
         *  - Used directly by tests and as the in-memory tables behind
         *    FileStatsStore, which rebuilds it from its journal at startup.
         *  - One mutex guards everything; calls are short.
         */
        class MemoryStatsStore : public StatsStore
        {
        public:
            MemoryStatsStore() = default;

            MemoryStatsStore(const MemoryStatsStore &)            = delete;
            MemoryStatsStore &operator=(const MemoryStatsStore &) = delete;

            UpsertResult openMatch(const Core::MatchRecord &match) override;
            UpsertResult closeMatch(const Core::MatchRecord &match) override;
            UpsertResult saveMatchProgress(const Core::MatchRecord &match) override;

            UpsertResult openSession(const Core::PlayerSession &session) override;
            UpsertResult closeSession(const Core::PlayerSession &session) override;

            UpsertResult upsertPlayerMatchStats(const Core::StatDelta &delta) override;
            UpsertResult upsertAllTimeStats(const Core::StatDelta &delta) override;

            bool flush() override { return true; }

            std::optional<Core::MatchRecord> match(const std::string &matchId) const override;
            std::vector<Core::MatchRecord> matches() const override;
            std::optional<Core::MatchRecord> activeMatch(const std::string &serverId) const override;
            std::vector<Core::PlayerSession> sessions(const std::string &matchId) const override;

            std::optional<Core::PlayerMatchStats> playerMatchStats(const std::string &matchId,
                                                                   const std::string &identity) const override;
            std::vector<Core::PlayerMatchStats> matchStats(const std::string &matchId) const override;

            std::optional<Core::PlayerMatchStats> allTimeStats(const std::string &identity) const override;
            std::vector<Core::PlayerMatchStats> allTime() const override;

            /// Whether a call with these arguments would change anything.
            bool wouldOpen(const Core::MatchRecord &match) const;
            bool wouldClose(const Core::MatchRecord &match) const;
            bool wouldSaveProgress(const Core::MatchRecord &match) const;
            bool wouldOpenSession(const Core::PlayerSession &session) const;
            bool wouldCloseSession(const Core::PlayerSession &session) const;
            bool hasPlayerMatchKey(const std::string &idempotencyKey) const;
            bool hasAllTimeKey(const std::string &idempotencyKey) const;

            std::size_t appliedKeys() const;

        private:
            using RowKey     = std::pair<std::string, std::string>;                  // (matchId, identity)
            using SessionKey = std::tuple<std::string, std::string, std::int64_t>; // (matchId, identity, joinedMs)

            static SessionKey sessionKey(const Core::PlayerSession &session);
            static bool sameProgress(const Core::MatchRecord &stored, const Core::MatchRecord &match);

            mutable std::mutex                             m_mutex;
            std::map<std::string, Core::MatchRecord>       m_matches;
            std::map<SessionKey, Core::PlayerSession>      m_sessions;
            std::map<RowKey, Core::PlayerMatchStats>       m_matchRows;
            std::map<std::string, Core::PlayerMatchStats>  m_allTimeRows;
            std::unordered_set<std::string>                m_matchKeys;
            std::unordered_set<std::string>                m_allTimeKeys;
        };

    } // namespace Stats
} // namespace StatTrack
