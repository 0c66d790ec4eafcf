#include "stats/MemoryStatsStore.hpp"

#include <limits>

#include "utils/TimeUtils.hpp"

namespace StatTrack
{
    namespace Stats
    {
        UpsertResult MemoryStatsStore::openMatch(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_matches.count(match.matchId) != 0)
            {
                return UpsertResult::Duplicate;
            }
            m_matches.emplace(match.matchId, match);
            return UpsertResult::Applied;
        }

        UpsertResult MemoryStatsStore::closeMatch(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_matches.find(match.matchId);
            if (it == m_matches.end())
            {
                Core::MatchRecord closed = match;
                closed.state = Core::MatchState::Concluded;
                m_matches.emplace(match.matchId, std::move(closed));
                return UpsertResult::Applied;
            }
            if (it->second.state == Core::MatchState::Concluded)
            {
                return UpsertResult::Duplicate;
            }

            Core::MatchRecord &stored = it->second;
            stored.state        = Core::MatchState::Concluded;
            stored.endedAt      = match.endedAt;
            stored.roundNumber  = match.roundNumber;
            stored.roundsPlayed = match.roundsPlayed;
            stored.winningTeam  = match.winningTeam;
            stored.gameOver     = match.gameOver;
            if (stored.mapName.empty())
            {
                stored.mapName  = match.mapName;
                stored.scenario = match.scenario;
                stored.lighting = match.lighting;
            }
            return UpsertResult::Applied;
        }

        bool MemoryStatsStore::sameProgress(const Core::MatchRecord &stored, const Core::MatchRecord &match)
        {
            return stored.state == match.state && stored.roundNumber == match.roundNumber &&
                   stored.roundsPlayed == match.roundsPlayed && stored.winningTeam == match.winningTeam &&
                   stored.gameOver == match.gameOver && (!stored.mapName.empty() || match.mapName.empty());
        }

        UpsertResult MemoryStatsStore::saveMatchProgress(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_matches.find(match.matchId);
            if (it == m_matches.end())
            {
                m_matches.emplace(match.matchId, match);
                return UpsertResult::Applied;
            }

            Core::MatchRecord &stored = it->second;
            if (!stored.isOpen() || !match.isOpen() || sameProgress(stored, match))
            {
                return UpsertResult::Duplicate;
            }

            stored.state        = match.state;
            stored.roundNumber  = match.roundNumber;
            stored.roundsPlayed = match.roundsPlayed;
            stored.winningTeam  = match.winningTeam;
            stored.gameOver     = match.gameOver;
            if (stored.mapName.empty())
            {
                stored.mapName  = match.mapName;
                stored.scenario = match.scenario;
                stored.lighting = match.lighting;
            }
            return UpsertResult::Applied;
        }

        MemoryStatsStore::SessionKey MemoryStatsStore::sessionKey(const Core::PlayerSession &session)
        {
            return SessionKey(session.matchId, session.identity, Utils::toMillisSinceEpoch(session.joinedAt));
        }

        UpsertResult MemoryStatsStore::openSession(const Core::PlayerSession &session)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_sessions.emplace(sessionKey(session), session).second)
            {
                return UpsertResult::Duplicate;
            }
            return UpsertResult::Applied;
        }

        UpsertResult MemoryStatsStore::closeSession(const Core::PlayerSession &session)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            const Utils::TimePoint leftAt = session.leftAt.value_or(session.joinedAt);
            auto it = m_sessions.find(sessionKey(session));
            if (it == m_sessions.end())
            {
                Core::PlayerSession closed = session;
                closed.leftAt = leftAt;
                m_sessions.emplace(sessionKey(session), std::move(closed));
                return UpsertResult::Applied;
            }
            if (!it->second.isOpen())
            {
                return UpsertResult::Duplicate;
            }

            it->second.leftAt = leftAt;
            if (session.team >= 0)
            {
                it->second.team = session.team;
            }
            return UpsertResult::Applied;
        }

        UpsertResult MemoryStatsStore::upsertPlayerMatchStats(const Core::StatDelta &delta)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_matchKeys.insert(delta.idempotencyKey).second)
            {
                return UpsertResult::Duplicate;
            }

            Core::PlayerMatchStats &row = m_matchRows[RowKey(delta.matchId, delta.identity)];
            row.matchId  = delta.matchId;
            row.identity = delta.identity;
            row.apply(delta);
            return UpsertResult::Applied;
        }

        UpsertResult MemoryStatsStore::upsertAllTimeStats(const Core::StatDelta &delta)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_allTimeKeys.insert(delta.idempotencyKey).second)
            {
                return UpsertResult::Duplicate;
            }

            Core::PlayerMatchStats &row = m_allTimeRows[delta.identity];
            row.identity = delta.identity;
            row.apply(delta);
            return UpsertResult::Applied;
        }

        std::optional<Core::MatchRecord> MemoryStatsStore::match(const std::string &matchId) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_matches.find(matchId);
            if (it == m_matches.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<Core::MatchRecord> MemoryStatsStore::matches() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<Core::MatchRecord> out;
            out.reserve(m_matches.size());
            for (const auto &entry : m_matches)
            {
                out.push_back(entry.second);
            }
            return out;
        }

        std::optional<Core::MatchRecord> MemoryStatsStore::activeMatch(const std::string &serverId) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const Core::MatchRecord *latest = nullptr;
            for (const auto &entry : m_matches)
            {
                const Core::MatchRecord &match = entry.second;
                if (match.serverId == serverId && match.isOpen() &&
                    (latest == nullptr || match.startedAt > latest->startedAt))
                {
                    latest = &match;
                }
            }
            if (latest == nullptr)
            {
                return std::nullopt;
            }
            return *latest;
        }

        std::vector<Core::PlayerSession> MemoryStatsStore::sessions(const std::string &matchId) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<Core::PlayerSession> out;
            const SessionKey first(matchId, std::string(), std::numeric_limits<std::int64_t>::min());
            for (auto it = m_sessions.lower_bound(first);
                 it != m_sessions.end() && std::get<0>(it->first) == matchId; ++it)
            {
                out.push_back(it->second);
            }
            return out;
        }

        std::optional<Core::PlayerMatchStats> MemoryStatsStore::playerMatchStats(const std::string &matchId,
                                                                                 const std::string &identity) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_matchRows.find(RowKey(matchId, identity));
            if (it == m_matchRows.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<Core::PlayerMatchStats> MemoryStatsStore::matchStats(const std::string &matchId) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<Core::PlayerMatchStats> out;
            for (auto it = m_matchRows.lower_bound(RowKey(matchId, std::string()));
                 it != m_matchRows.end() && it->first.first == matchId; ++it)
            {
                out.push_back(it->second);
            }
            return out;
        }

        std::optional<Core::PlayerMatchStats> MemoryStatsStore::allTimeStats(const std::string &identity) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_allTimeRows.find(identity);
            if (it == m_allTimeRows.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<Core::PlayerMatchStats> MemoryStatsStore::allTime() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<Core::PlayerMatchStats> out;
            out.reserve(m_allTimeRows.size());
            for (const auto &entry : m_allTimeRows)
            {
                out.push_back(entry.second);
            }
            return out;
        }

        bool MemoryStatsStore::wouldOpen(const Core::MatchRecord &match) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_matches.count(match.matchId) == 0;
        }

        bool MemoryStatsStore::wouldClose(const Core::MatchRecord &match) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_matches.find(match.matchId);
            return it == m_matches.end() || it->second.state != Core::MatchState::Concluded;
        }

        bool MemoryStatsStore::wouldSaveProgress(const Core::MatchRecord &match) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_matches.find(match.matchId);
            if (it == m_matches.end())
            {
                return true;
            }
            return it->second.isOpen() && match.isOpen() && !sameProgress(it->second, match);
        }

        bool MemoryStatsStore::wouldOpenSession(const Core::PlayerSession &session) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_sessions.count(sessionKey(session)) == 0;
        }

        bool MemoryStatsStore::wouldCloseSession(const Core::PlayerSession &session) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(sessionKey(session));
            return it == m_sessions.end() || it->second.isOpen();
        }

        bool MemoryStatsStore::hasPlayerMatchKey(const std::string &idempotencyKey) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_matchKeys.count(idempotencyKey) != 0;
        }

        bool MemoryStatsStore::hasAllTimeKey(const std::string &idempotencyKey) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_allTimeKeys.count(idempotencyKey) != 0;
        }

        std::size_t MemoryStatsStore::appliedKeys() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_matchKeys.size() + m_allTimeKeys.size();
        }

    } // namespace Stats
} // namespace StatTrack
