#include "query/QueryPoller.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Query
    {
        QueryPoller::QueryPoller(std::unique_ptr<A2SClient> client,
                                 std::chrono::milliseconds interval,
                                 SnapshotSink sink)
            : m_client(std::move(client)),
              m_interval(interval),
              m_sink(std::move(sink))
        {
            if (!m_client)
            {
                throw std::invalid_argument("QueryPoller requires a client");
            }
            if (m_interval.count() <= 0)
            {
                throw std::invalid_argument("QueryPoller interval must be positive");
            }
        }

        QueryPoller::~QueryPoller()
        {
            stop();
        }

        void QueryPoller::start()
        {
            if (m_thread.joinable())
            {
                return;
            }
            m_cancel.store(false);
            m_thread = std::thread(&QueryPoller::run, this);
            Utils::getLogger().info("[" + serverId() + "] query poller started for " +
                                    m_client->address() + " every " +
                                    std::to_string(m_interval.count()) + " ms");
        }

        void QueryPoller::stop()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_cancel.store(true);
            }
            m_cv.notify_all();
            if (m_thread.joinable())
            {
                m_thread.join();
                Utils::getLogger().info("[" + serverId() + "] query poller stopped");
            }
        }

        bool QueryPoller::pollOnce()
        {
            bool expected = false;
            if (!m_busy.compare_exchange_strong(expected, true))
            {
                ++m_cyclesSkipped;
                Utils::getLogger().debug("[" + serverId() + "] query cycle skipped, previous still running");
                return false;
            }

            auto &log = Utils::getLogger();
            try
            {
                Core::LiveSnapshot snap = m_client->query(&m_cancel);
                ++m_cyclesRun;

                if (!snap.reachable)
                {
                    ++m_unreachable;
                    if (m_lastReachable)
                    {
                        log.warn("[" + serverId() + "] server unreachable: " + snap.error);
                    }
                    else
                    {
                        log.debug("[" + serverId() + "] still unreachable: " + snap.error);
                    }
                }
                else
                {
                    if (!m_lastReachable)
                    {
                        log.info("[" + serverId() + "] server reachable again");
                    }
                    log.debug("[" + serverId() + "] snapshot with " +
                              std::to_string(snap.players.size()) + " player(s)");
                }
                m_lastReachable = snap.reachable;

                // A query abandoned by stop() says nothing about the server.
                if (!m_cancel.load() && m_sink)
                {
                    m_sink(std::move(snap));
                }
            }
            catch (const std::exception &ex)
            {
                log.error("[" + serverId() + "] query cycle failed: " + ex.what());
            }

            m_busy.store(false);
            return true;
        }

        void QueryPoller::run()
        {
            using Clock = std::chrono::steady_clock;
            auto next = Clock::now();

            while (!m_cancel.load())
            {
                pollOnce();

                next += m_interval;
                const auto now = Clock::now();
                while (next <= now)
                {
                    ++m_cyclesSkipped;
                    next += m_interval;
                }

                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait_until(lock, next, [this] { return m_cancel.load(); });
            }
        }

    } // namespace Query
} // namespace StatTrack
