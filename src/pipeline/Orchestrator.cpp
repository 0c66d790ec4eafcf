#include "pipeline/Orchestrator.hpp"

#include <sstream>
#include <utility>

#include "query/A2SClient.hpp"
#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        std::string describe(const ServerSummary &summary)
        {
            std::ostringstream out;
            out << "[" << summary.serverId << "] lines=" << summary.tailer.lines
                << " unrecognized=" << summary.tailer.unrecognized
                << " rotations=" << summary.tailer.rotations
                << " io_errors=" << summary.tailer.ioErrors
                << " events=" << summary.tracker.events
                << " out_of_round=" << summary.tracker.tracker.outOfRoundEvents
                << " ignored_transitions=" << summary.tracker.tracker.ignoredTransitions
                << " deltas_applied=" << summary.tracker.stats.applied
                << " duplicates=" << summary.tracker.stats.duplicates
                << " store_failures=" << summary.tracker.stats.failures
                << " matches=" << summary.tracker.stats.matchesClosed
                << " sessions=" << summary.tracker.stats.sessionsClosed
                << " cursor_commits=" << summary.tailer.commits;
            if (summary.queried)
            {
                out << " queries=" << summary.queryCycles << " unreachable=" << summary.unreachableCycles;
            }
            return out.str();
        }

        Orchestrator::Orchestrator(EngineSettings settings, Stats::StatsStore &store,
                                   Query::TransportFactory transports)
            : m_settings(std::move(settings)),
              m_store(store),
              m_transports(std::move(transports)),
              m_cursors(m_settings.stateDir)
        {
            m_settings.validate();
        }

        Orchestrator::~Orchestrator()
        {
            stop();
        }

        std::size_t Orchestrator::start(const std::vector<Core::ServerTarget> &targets)
        {
            std::size_t started = 0;
            for (const auto &target : targets)
            {
                if (startServer(target))
                {
                    ++started;
                }
            }
            Utils::getLogger().info("Started " + std::to_string(started) + " of " +
                                    std::to_string(targets.size()) + " configured servers");
            return started;
        }

        bool Orchestrator::startServer(const Core::ServerTarget &target)
        {
            if (!target.enabled)
            {
                Utils::getLogger().info("[" + target.name + "] disabled, not started");
                return false;
            }
            if (target.name.empty() || target.logPath.empty())
            {
                Utils::getLogger().warn("Server target without name or log path skipped");
                return false;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_servers.count(target.name) != 0)
            {
                Utils::getLogger().warn("[" + target.name + "] already running, duplicate target skipped");
                return false;
            }

            auto runtime = std::make_unique<ServerRuntime>();
            runtime->tracker = std::make_unique<TrackerTask>(target.name, m_store, m_settings);

            TrackerTask *tracker = runtime->tracker.get();
            runtime->tailer = std::make_unique<TailerTask>(
                target, m_cursors, m_settings,
                [tracker](ServerMessage message) { return tracker->post(std::move(message)); });

            TailerTask *tailer = runtime->tailer.get();
            tracker->setCursorCommit([tailer](const Core::LogCursor &cursor) { return tailer->commit(cursor); });

            if (target.queryAddress)
            {
                auto client = std::make_unique<Query::A2SClient>(target.name, *target.queryAddress,
                                                                 m_settings.queryOptions(), m_transports);
                runtime->poller = std::make_unique<Query::QueryPoller>(
                    std::move(client),
                    std::chrono::duration_cast<std::chrono::milliseconds>(m_settings.queryInterval),
                    [tracker](Core::LiveSnapshot snapshot)
                    {
                        if (!tracker->post(std::move(snapshot)))
                        {
                            Utils::getLogger().debug("[" + tracker->serverId() + "] snapshot after stop dropped");
                        }
                    });
            }

            tracker->start();
            tailer->start();
            if (runtime->poller)
            {
                runtime->poller->start();
            }

            Utils::getLogger().info("[" + target.name + "] started" +
                                    (target.queryAddress ? " with queries to " + *target.queryAddress : ""));
            m_servers.emplace(target.name, std::move(runtime));
            return true;
        }

        std::optional<ServerSummary> Orchestrator::stopServer(const std::string &serverId)
        {
            std::unique_ptr<ServerRuntime> runtime;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_servers.find(serverId);
                if (it == m_servers.end())
                {
                    return std::nullopt;
                }
                runtime = std::move(it->second);
                m_servers.erase(it);
            }

            shutdown(*runtime);
            ServerSummary summary = summarize(serverId, *runtime);
            Utils::getLogger().info("[" + serverId + "] stopped");
            return summary;
        }

        std::vector<ServerSummary> Orchestrator::stop()
        {
            std::map<std::string, std::unique_ptr<ServerRuntime>> servers;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                servers.swap(m_servers);
            }
            if (servers.empty())
            {
                return {};
            }

            // Producers of every server stop before any tracker drains.
            for (auto &entry : servers)
            {
                if (entry.second->poller)
                {
                    entry.second->poller->stop();
                }
            }
            for (auto &entry : servers)
            {
                entry.second->tailer->stop();
            }

            std::vector<ServerSummary> summaries;
            for (auto &entry : servers)
            {
                shutdown(*entry.second);
                summaries.push_back(summarize(entry.first, *entry.second));
            }
            Utils::getLogger().info("Stopped " + std::to_string(summaries.size()) + " servers");
            return summaries;
        }

        bool Orchestrator::isRunning(const std::string &serverId) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_servers.count(serverId) != 0;
        }

        std::vector<std::string> Orchestrator::serverIds() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<std::string> ids;
            for (const auto &entry : m_servers)
            {
                ids.push_back(entry.first);
            }
            return ids;
        }

        std::vector<ServerSummary> Orchestrator::summaries() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::vector<ServerSummary> out;
            for (const auto &entry : m_servers)
            {
                out.push_back(summarize(entry.first, *entry.second));
            }
            return out;
        }

        ServerSummary Orchestrator::summarize(const std::string &serverId, const ServerRuntime &runtime)
        {
            ServerSummary summary;
            summary.serverId = serverId;
            summary.tailer   = runtime.tailer->counters();
            summary.tracker  = runtime.tracker->summary();
            if (runtime.poller)
            {
                summary.queried           = true;
                summary.queryCycles       = runtime.poller->cyclesRun();
                summary.unreachableCycles = runtime.poller->unreachableCycles();
            }
            return summary;
        }

        void Orchestrator::shutdown(ServerRuntime &runtime)
        {
            if (runtime.poller)
            {
                runtime.poller->stop();
            }
            runtime.tailer->stop();
            runtime.tracker->stop();
        }

    } // namespace Pipeline
} // namespace StatTrack
