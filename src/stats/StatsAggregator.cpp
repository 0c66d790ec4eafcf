#include "stats/StatsAggregator.hpp"

#include <utility>

#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Stats
    {
        StatsAggregator::StatsAggregator(StatsStore &store, std::size_t dedupWindow)
            : m_store(store),
              m_window(dedupWindow == 0 ? 1 : dedupWindow)
        {
        }

        UpsertResult StatsAggregator::apply(const Core::StatDelta &delta)
        {
            if (m_recent.count(delta.idempotencyKey) != 0)
            {
                ++m_counters.duplicates;
                return UpsertResult::Duplicate;
            }

            const UpsertResult result = applyToStore(delta);
            if (result == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingDeltas.push_back(delta);
                Utils::getLogger().error("Stats store refused delta " + delta.idempotencyKey +
                                         ", will retry");
            }
            return result;
        }

        UpsertResult StatsAggregator::applyToStore(const Core::StatDelta &delta)
        {
            const UpsertResult perMatch = m_store.upsertPlayerMatchStats(delta);
            const UpsertResult allTime  = m_store.upsertAllTimeStats(delta);

            if (perMatch == UpsertResult::Failed || allTime == UpsertResult::Failed)
            {
                return UpsertResult::Failed;
            }

            remember(delta.idempotencyKey);
            if (perMatch == UpsertResult::Duplicate && allTime == UpsertResult::Duplicate)
            {
                ++m_counters.duplicates;
                return UpsertResult::Duplicate;
            }
            ++m_counters.applied;
            return UpsertResult::Applied;
        }

        bool StatsAggregator::applyBatch(const Core::StatBatch &batch)
        {
            bool ok = true;
            for (const auto &delta : batch.deltas)
            {
                if (apply(delta) == UpsertResult::Failed)
                {
                    ok = false;
                }
            }
            return ok;
        }

        bool StatsAggregator::openMatch(const Core::MatchRecord &match)
        {
            const UpsertResult result = m_store.openMatch(match);
            if (result == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingOpens.push_back(match);
                return false;
            }
            if (result == UpsertResult::Applied)
            {
                ++m_counters.matchesOpened;
            }
            return true;
        }

        bool StatsAggregator::closeMatch(const Core::MatchRecord &match)
        {
            const UpsertResult result = m_store.closeMatch(match);
            if (result == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingCloses.push_back(match);
                return false;
            }
            if (result == UpsertResult::Applied)
            {
                ++m_counters.matchesClosed;
            }
            return true;
        }

        bool StatsAggregator::saveMatchProgress(const Core::MatchRecord &match)
        {
            if (m_store.saveMatchProgress(match) == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingProgress = match;
                return false;
            }
            if (m_pendingProgress && m_pendingProgress->matchId == match.matchId)
            {
                m_pendingProgress.reset();
            }
            return true;
        }

        bool StatsAggregator::openSession(const Core::PlayerSession &session)
        {
            const UpsertResult result = m_store.openSession(session);
            if (result == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingSessionOpens.push_back(session);
                return false;
            }
            if (result == UpsertResult::Applied)
            {
                ++m_counters.sessionsOpened;
            }
            return true;
        }

        bool StatsAggregator::closeSession(const Core::PlayerSession &session)
        {
            const UpsertResult result = m_store.closeSession(session);
            if (result == UpsertResult::Failed)
            {
                ++m_counters.failures;
                m_pendingSessionCloses.push_back(session);
                return false;
            }
            if (result == UpsertResult::Applied)
            {
                ++m_counters.sessionsClosed;
            }
            return true;
        }

        bool StatsAggregator::retryPending()
        {
            if (!hasPending())
            {
                return true;
            }

            // Opens before closes so a retried close finds its match.
            std::vector<Core::MatchRecord> opens;
            opens.swap(m_pendingOpens);
            for (const auto &match : opens)
            {
                openMatch(match);
            }

            std::vector<Core::PlayerSession> sessionOpens;
            sessionOpens.swap(m_pendingSessionOpens);
            for (const auto &session : sessionOpens)
            {
                openSession(session);
            }

            std::deque<Core::StatDelta> deltas;
            deltas.swap(m_pendingDeltas);
            for (const auto &delta : deltas)
            {
                if (applyToStore(delta) == UpsertResult::Failed)
                {
                    m_pendingDeltas.push_back(delta);
                }
            }

            std::vector<Core::PlayerSession> sessionCloses;
            sessionCloses.swap(m_pendingSessionCloses);
            for (const auto &session : sessionCloses)
            {
                closeSession(session);
            }

            if (m_pendingProgress)
            {
                const Core::MatchRecord progress = *m_pendingProgress;
                m_pendingProgress.reset();
                saveMatchProgress(progress);
            }

            std::vector<Core::MatchRecord> closes;
            closes.swap(m_pendingCloses);
            for (const auto &match : closes)
            {
                closeMatch(match);
            }

            if (hasPending())
            {
                Utils::getLogger().warn("Stats store still refuses " +
                                        std::to_string(pendingCount()) +
                                        " pending update(s)");
                return false;
            }
            Utils::getLogger().info("Pending stats updates written");
            return true;
        }

        bool StatsAggregator::hasPending() const noexcept
        {
            return pendingCount() != 0;
        }

        std::size_t StatsAggregator::pendingCount() const noexcept
        {
            return m_pendingDeltas.size() + m_pendingOpens.size() + m_pendingCloses.size() +
                   m_pendingSessionOpens.size() + m_pendingSessionCloses.size() + (m_pendingProgress ? 1 : 0);
        }

        bool StatsAggregator::flush()
        {
            const bool drained = retryPending();
            const bool flushed = m_store.flush();
            return drained && flushed;
        }

        void StatsAggregator::remember(const std::string &key)
        {
            if (!m_recent.insert(key).second)
            {
                return;
            }
            m_recentOrder.push_back(key);
            while (m_recentOrder.size() > m_window)
            {
                m_recent.erase(m_recentOrder.front());
                m_recentOrder.pop_front();
            }
        }

    } // namespace Stats
} // namespace StatTrack
