#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "pipeline/BoundedQueue.hpp"
#include "pipeline/EngineSettings.hpp"
#include "pipeline/ServerMessage.hpp"
#include "stats/StatsAggregator.hpp"
#include "stats/StatsStore.hpp"
#include "tracking/MatchTracker.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        struct TrackerTaskSummary
        {
            std::string                  serverId;
            std::uint64_t                events = 0;
            std::uint64_t                snapshots = 0;
            std::uint64_t                checkpointsCommitted = 0;
            Tracking::TrackerCounters    tracker;
            Stats::AggregatorCounters    stats;
        };

        /**
         * TrackerTask
         *
         * Responsibilities:
         *  - Own one server's queue, MatchTracker and StatsAggregator, and
         *    consume the queue on a single thread in arrival order.
         *  - Forward everything the tracker produces to the stats store.
         *  - Commit cursor checkpoints once the stats before them are durable.
         *
         * Design notes:
         *  - Producers (tailer, poller) only touch the queue; all match
         *    state is confined to this task's thread, so no locking is
         *    needed around the tracker.
         *  - start() first restores the server's open match and sessions
         *    from the store, so a restart continues the match it left.
         *  - Each checkpoint saves the open match's round progress before
         *    the flush that makes the cursor committable.
         *  - stop() closes the queue and lets the thread drain what was
         *    already queued, then flushes. The open match stays open.
         *  - A checkpoint is held back while the aggregator has updates the
         *    store refused. It is committed with the next successful flush;
         *    until then a restart re-reads those lines and the store's
         *    idempotency keys drop what already landed.
         */
        class TrackerTask
        {
        public:
            /// Persist a checkpoint; returns false if it could not be saved.
            using CursorCommit = std::function<bool(const Core::LogCursor &)>;

            TrackerTask(std::string serverId, Stats::StatsStore &store, const EngineSettings &settings);

            TrackerTask(const TrackerTask &)            = delete;
            TrackerTask &operator=(const TrackerTask &) = delete;

            ~TrackerTask();

            void setCursorCommit(CursorCommit commit) { m_commit = std::move(commit); }

            /// Restore the open match (once), then start consuming.
            void start();

            /// Close the queue, drain it and flush. Idempotent.
            void stop();

            bool isRunning() const noexcept { return m_thread.joinable(); }

            /// Enqueue one message; blocks while the queue is full. False once stopped.
            bool post(ServerMessage message);

            std::size_t queued() const { return m_queue.size(); }

            TrackerTaskSummary summary() const;

            const std::string &serverId() const noexcept { return m_serverId; }

        private:
            bool resume();
            void run();
            void process(ServerMessage &message);
            void forward(const Tracking::TrackerOutput &out);
            void commitCheckpoint(const Core::LogCursor &cursor);
            void finish();

        private:
            std::string                 m_serverId;
            BoundedQueue<ServerMessage> m_queue;
            Tracking::MatchTracker      m_tracker;
            Stats::StatsStore          &m_store;
            Stats::StatsAggregator      m_aggregator;
            CursorCommit                m_commit;

            std::optional<Core::LogCursor> m_heldCheckpoint;
            bool                           m_started = false;

            mutable std::mutex m_summaryMutex;
            TrackerTaskSummary m_summary;

            std::thread m_thread;
        };

    } // namespace Pipeline
} // namespace StatTrack
