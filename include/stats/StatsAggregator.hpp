#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/Match.hpp"
#include "core/StatDelta.hpp"
#include "stats/StatsStore.hpp"

namespace StatTrack
{
    namespace Stats
    {
        struct AggregatorCounters
        {
            std::uint64_t applied = 0;
            std::uint64_t duplicates = 0;   ///< Caught by the window or by the store.
            std::uint64_t failures = 0;     ///< Store refused; queued for retry.
            std::uint64_t matchesOpened = 0;
            std::uint64_t matchesClosed = 0;
            std::uint64_t sessionsOpened = 0;
            std::uint64_t sessionsClosed = 0;
        };

        /**
         * StatsAggregator
         *
         * Responsibilities:
         *  - Apply StatDeltas to the per-match and the all-time table of a
         *    StatsStore exactly once.
         *  - Forward match lifecycle records, round progress and player
         *    sessions to the store.
         *  - Keep whatever the store refused and retry it later.
         *
         * Design notes:
         *  - A bounded window of recently applied keys answers most replayed
         *    deltas without touching the store; the store's own key check
         *    covers everything older than the window.
         *  - A delta counts as applied only when both tables accepted it.
         *    If one of them failed, the whole delta is retried; the table
         *    that already has it reports Duplicate, so the two never diverge
         *    once the retry succeeds.
         *  - Counters only ever increase: cost is O(1) per delta.
         *  - One aggregator per server task; the store is the only shared part.
         */
        class StatsAggregator
        {
        public:
            explicit StatsAggregator(StatsStore &store, std::size_t dedupWindow = 4096);

            StatsAggregator(const StatsAggregator &)            = delete;
            StatsAggregator &operator=(const StatsAggregator &) = delete;

            UpsertResult apply(const Core::StatDelta &delta);

            /// Apply every delta of one log line. False if any of them failed.
            bool applyBatch(const Core::StatBatch &batch);

            bool openMatch(const Core::MatchRecord &match);
            bool closeMatch(const Core::MatchRecord &match);

            /// Only the latest refused progress of a match is kept for retry.
            bool saveMatchProgress(const Core::MatchRecord &match);

            bool openSession(const Core::PlayerSession &session);
            bool closeSession(const Core::PlayerSession &session);

            /// Retry everything the store refused. Returns true when nothing is left pending.
            bool retryPending();

            bool hasPending() const noexcept;
            std::size_t pendingCount() const noexcept;

            /// Retry pending work, then flush the store.
            bool flush();

            const AggregatorCounters &counters() const noexcept { return m_counters; }

            std::size_t windowSize() const noexcept { return m_recentOrder.size(); }

        private:
            UpsertResult applyToStore(const Core::StatDelta &delta);
            void remember(const std::string &key);

        private:
            StatsStore                      &m_store;
            std::size_t                      m_window;
            std::unordered_set<std::string>  m_recent;
            std::deque<std::string>          m_recentOrder;

            std::deque<Core::StatDelta>      m_pendingDeltas;
            std::vector<Core::MatchRecord>   m_pendingOpens;
            std::vector<Core::MatchRecord>   m_pendingCloses;
            std::optional<Core::MatchRecord> m_pendingProgress;
            std::vector<Core::PlayerSession> m_pendingSessionOpens;
            std::vector<Core::PlayerSession> m_pendingSessionCloses;

            AggregatorCounters               m_counters;
        };

    } // namespace Stats
} // namespace StatTrack
