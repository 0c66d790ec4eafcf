#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "core/LiveSnapshot.hpp"
#include "query/A2SClient.hpp"

namespace StatTrack
{
    namespace Query
    {
        /**
         * QueryPoller
         *
         * Responsibilities:
         *  - Run one A2SClient query per server on a fixed interval,
         *    independent of log volume.
         *  - Hand every snapshot (reachable or not) to a sink.
         *
         * Design notes:
         *  - Ticks are scheduled on a fixed grid. A cycle that overruns the
         *    interval makes the poller skip the ticks it missed instead of
         *    running them back to back, and pollOnce() refuses to start a
         *    cycle while another one is in flight (skip-if-busy).
         *  - stop() sets the cancel flag the client checks, so an in-flight
         *    query is abandoned within one receive slice.
         *  - Reachability changes are logged once (WARN on loss, INFO on
         *    recovery) rather than on every failed cycle.
         */
        class QueryPoller
        {
        public:
            using SnapshotSink = std::function<void(Core::LiveSnapshot)>;

            QueryPoller(std::unique_ptr<A2SClient> client,
                        std::chrono::milliseconds interval,
                        SnapshotSink sink);

            QueryPoller(const QueryPoller &)            = delete;
            QueryPoller &operator=(const QueryPoller &) = delete;

            ~QueryPoller();

            /// Start the background thread. The first cycle runs immediately.
            void start();

            /// Cancel any in-flight query and join the thread. Idempotent.
            void stop();

            bool isRunning() const noexcept { return m_thread.joinable(); }

            /**
             * Run one cycle on the calling thread.
             * Returns false without querying if a cycle is already running.
             */
            bool pollOnce();

            const std::string &serverId() const noexcept { return m_client->serverId(); }

            std::size_t cyclesRun() const noexcept { return m_cyclesRun.load(); }
            std::size_t cyclesSkipped() const noexcept { return m_cyclesSkipped.load(); }
            std::size_t unreachableCycles() const noexcept { return m_unreachable.load(); }

        private:
            void run();

        private:
            std::unique_ptr<A2SClient> m_client;
            std::chrono::milliseconds  m_interval;
            SnapshotSink               m_sink;

            std::atomic<bool> m_busy{false};
            std::atomic<bool> m_cancel{false};
            bool              m_lastReachable = true;  // guarded by m_busy

            std::atomic<std::size_t> m_cyclesRun{0};
            std::atomic<std::size_t> m_cyclesSkipped{0};
            std::atomic<std::size_t> m_unreachable{0};

            std::mutex              m_mutex;
            std::condition_variable m_cv;
            std::thread             m_thread;
        };

    } // namespace Query
} // namespace StatTrack
