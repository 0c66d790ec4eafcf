#include "pipeline/TrackerTask.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        TrackerTask::TrackerTask(std::string serverId, Stats::StatsStore &store, const EngineSettings &settings)
            : m_serverId(std::move(serverId)),
              m_queue(settings.queueCapacity),
              m_tracker(m_serverId, settings.trackerOptions()),
              m_store(store),
              m_aggregator(store, settings.dedupWindow)
        {
            m_summary.serverId = m_serverId;
        }

        bool TrackerTask::resume()
        {
            const auto match = m_store.activeMatch(m_serverId);
            if (!match)
            {
                return false;
            }

            std::vector<Core::PlayerSession> open;
            for (auto &session : m_store.sessions(match->matchId))
            {
                if (session.isOpen())
                {
                    open.push_back(std::move(session));
                }
            }
            return m_tracker.restore(*match, open);
        }

        TrackerTask::~TrackerTask()
        {
            stop();
        }

        void TrackerTask::start()
        {
            if (m_thread.joinable() || m_queue.closed())
            {
                return;
            }
            if (!m_started)
            {
                m_started = true;
                resume();
            }
            m_thread = std::thread(&TrackerTask::run, this);
        }

        void TrackerTask::stop()
        {
            m_queue.close();
            if (m_thread.joinable())
            {
                m_thread.join();
            }
        }

        bool TrackerTask::post(ServerMessage message)
        {
            return m_queue.push(std::move(message));
        }

        TrackerTaskSummary TrackerTask::summary() const
        {
            std::lock_guard<std::mutex> lock(m_summaryMutex);
            return m_summary;
        }

        void TrackerTask::run()
        {
            Utils::getLogger().debug("[" + m_serverId + "] tracker task started");

            while (auto message = m_queue.pop())
            {
                try
                {
                    process(*message);
                }
                catch (const std::exception &ex)
                {
                    Utils::getLogger().error("[" + m_serverId + "] dropping message after error: " + ex.what());
                }
            }

            try
            {
                finish();
            }
            catch (const std::exception &ex)
            {
                Utils::getLogger().error("[" + m_serverId + "] shutdown of tracker failed: " + ex.what());
            }
        }

        void TrackerTask::process(ServerMessage &message)
        {
            if (auto *event = std::get_if<Core::Event>(&message))
            {
                forward(m_tracker.handle(*event));
                std::lock_guard<std::mutex> lock(m_summaryMutex);
                ++m_summary.events;
                m_summary.tracker = m_tracker.counters();
                m_summary.stats   = m_aggregator.counters();
            }
            else if (auto *snapshot = std::get_if<Core::LiveSnapshot>(&message))
            {
                forward(m_tracker.mergeSnapshot(*snapshot));
                std::lock_guard<std::mutex> lock(m_summaryMutex);
                ++m_summary.snapshots;
                m_summary.tracker = m_tracker.counters();
                m_summary.stats   = m_aggregator.counters();
            }
            else if (auto *checkpoint = std::get_if<CursorCheckpoint>(&message))
            {
                commitCheckpoint(checkpoint->cursor);
            }
        }

        void TrackerTask::forward(const Tracking::TrackerOutput &out)
        {
            // Closes first: a MapChange ends the old match before it opens the next.
            for (const auto &session : out.sessionsClosed)
            {
                m_aggregator.closeSession(session);
            }
            for (const auto &match : out.matchesClosed)
            {
                m_aggregator.closeMatch(match);
            }
            for (const auto &match : out.matchesOpened)
            {
                m_aggregator.openMatch(match);
            }
            for (const auto &session : out.sessionsOpened)
            {
                m_aggregator.openSession(session);
            }
            for (const auto &batch : out.batches)
            {
                m_aggregator.applyBatch(batch);
            }
        }

        void TrackerTask::commitCheckpoint(const Core::LogCursor &cursor)
        {
            // A newer checkpoint supersedes one that is still held back.
            m_heldCheckpoint = cursor;

            // Progress is saved only with a checkpoint so it never runs ahead of the cursor.
            if (const auto &match = m_tracker.currentMatch())
            {
                m_aggregator.saveMatchProgress(*match);
            }

            if (!m_aggregator.flush())
            {
                Utils::getLogger().warn("[" + m_serverId + "] stats not durable yet, holding cursor at offset " +
                                        std::to_string(cursor.byteOffset));
                return;
            }

            if (m_commit && !m_commit(*m_heldCheckpoint))
            {
                return;  // keep it held, try again with the next checkpoint
            }
            m_heldCheckpoint.reset();

            std::lock_guard<std::mutex> lock(m_summaryMutex);
            ++m_summary.checkpointsCommitted;
            m_summary.stats = m_aggregator.counters();
        }

        void TrackerTask::finish()
        {
            if (m_tracker.currentMatch())
            {
                Utils::getLogger().info("[" + m_serverId + "] match " + m_tracker.currentMatch()->matchId +
                                        " left open for the next run");
            }

            if (m_heldCheckpoint)
            {
                commitCheckpoint(*m_heldCheckpoint);
            }
            else if (!m_aggregator.flush())
            {
                Utils::getLogger().critical("[" + m_serverId + "] stats could not be flushed on shutdown");
            }

            if (m_heldCheckpoint)
            {
                Utils::getLogger().critical("[" + m_serverId + "] cursor at offset " +
                                            std::to_string(m_heldCheckpoint->byteOffset) +
                                            " not committed on shutdown");
            }

            std::lock_guard<std::mutex> lock(m_summaryMutex);
            m_summary.tracker = m_tracker.counters();
            m_summary.stats   = m_aggregator.counters();
        }

    } // namespace Pipeline
} // namespace StatTrack
