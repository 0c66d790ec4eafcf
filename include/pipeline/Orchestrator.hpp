#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ServerTarget.hpp"
#include "input/CursorStore.hpp"
#include "pipeline/EngineSettings.hpp"
#include "pipeline/TailerTask.hpp"
#include "pipeline/TrackerTask.hpp"
#include "query/DatagramTransport.hpp"
#include "query/QueryPoller.hpp"
#include "stats/StatsStore.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        struct ServerSummary
        {
            std::string        serverId;
            TailerCounters     tailer;
            TrackerTaskSummary tracker;
            bool               queried = false;
            std::size_t        queryCycles = 0;
            std::size_t        unreachableCycles = 0;
        };

        /// One line per server for the operator log.
        std::string describe(const ServerSummary &summary);

        /**
         * Orchestrator
         *
         * Responsibilities:
         *  - Keep the registry of running servers, each with its tracker
         *    task, tailer task and (if a query address is set) query poller.
         *  - Wire tailer and poller output into the server's tracker queue
         *    and the tracker's checkpoint commits back into the tailer.
         *  - Start and stop servers individually or all at once.
         *
         * Design notes:
         *  - Servers share nothing but the StatsStore and the state
         *    directory the CursorStore writes into (one file per server).
         *  - Stopping a server stops its producers first (poller, then
         *    tailer with its final checkpoint) and then the tracker, which
         *    drains its queue and flushes. Open matches stay open and are
         *    resumed by the next start.
         */
        class Orchestrator
        {
        public:
            Orchestrator(EngineSettings settings, Stats::StatsStore &store,
                         Query::TransportFactory transports = Query::udpTransportFactory());

            Orchestrator(const Orchestrator &)            = delete;
            Orchestrator &operator=(const Orchestrator &) = delete;

            ~Orchestrator();

            /// Start every enabled target; returns how many were started.
            std::size_t start(const std::vector<Core::ServerTarget> &targets);

            /**
             * Start one server.
             * Returns false for a disabled target, a target without a name
             * or log path, and a server id that is already running.
             */
            bool startServer(const Core::ServerTarget &target);

            /// Stop one server and return its final summary; std::nullopt if unknown.
            std::optional<ServerSummary> stopServer(const std::string &serverId);

            /// Stop every server; returns their final summaries in id order.
            std::vector<ServerSummary> stop();

            bool isRunning(const std::string &serverId) const;

            std::vector<std::string> serverIds() const;

            std::vector<ServerSummary> summaries() const;

            const EngineSettings &settings() const noexcept { return m_settings; }

        private:
            struct ServerRuntime
            {
                std::unique_ptr<TrackerTask>        tracker;
                std::unique_ptr<TailerTask>         tailer;
                std::unique_ptr<Query::QueryPoller> poller;
            };

            static ServerSummary summarize(const std::string &serverId, const ServerRuntime &runtime);
            static void shutdown(ServerRuntime &runtime);

        private:
            EngineSettings          m_settings;
            Stats::StatsStore      &m_store;
            Query::TransportFactory m_transports;
            Input::CursorStore      m_cursors;

            mutable std::mutex                                     m_mutex;
            std::map<std::string, std::unique_ptr<ServerRuntime>> m_servers;
        };

    } // namespace Pipeline
} // namespace StatTrack
