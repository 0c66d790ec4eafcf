#include "pipeline/TailerTask.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        TailerTask::TailerTask(Core::ServerTarget target, Input::CursorStore &cursors,
                               const EngineSettings &settings, Sink sink)
            : m_target(std::move(target)),
              m_cursors(cursors),
              m_settings(settings),
              m_sink(std::move(sink)),
              m_tailer(m_target.name, m_target.logPath),
              m_backoff(settings.pollInterval)
        {
        }

        TailerTask::~TailerTask()
        {
            stop();
        }

        void TailerTask::start()
        {
            if (m_thread.joinable())
            {
                return;
            }
            m_stop = false;
            m_thread = std::thread(&TailerTask::run, this);
        }

        void TailerTask::stop()
        {
            if (!m_thread.joinable())
            {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(m_waitMutex);
                m_stop = true;
            }
            m_waitCv.notify_all();
            m_thread.join();
        }

        Input::TailStatus TailerTask::pollOnce()
        {
            if (!m_opened)
            {
                std::optional<Core::LogCursor> saved = m_cursors.load(m_target.name);
                if (saved && saved->path != m_target.logPath)
                {
                    Utils::getLogger().warn("[" + m_target.name + "] saved cursor is for " + saved->path +
                                            ", starting " + m_target.logPath + " from the beginning");
                    saved.reset();
                }
                if (saved)
                {
                    m_checkpointedIdentity = saved->fileIdentity;
                    m_checkpointedOffset   = saved->byteOffset;
                    Utils::getLogger().info("[" + m_target.name + "] resuming " + m_target.logPath + " at offset " +
                                            std::to_string(saved->byteOffset));
                }
                m_tailer.open(saved);
                m_opened = true;
                m_lastCheckpoint = std::chrono::steady_clock::now();
            }

            Input::TailResult result = m_tailer.poll();

            if (result.rotated)
            {
                Utils::getLogger().info("[" + m_target.name + "] " + m_target.logPath +
                                        " rotated, now reading " + m_tailer.cursor().fileIdentity);
            }
            if (result.status == Input::TailStatus::IoError)
            {
                Utils::getLogger().error("[" + m_target.name + "] reading " + m_target.logPath + ": " + result.error);
            }
            else if (result.status == Input::TailStatus::Missing && m_lastStatus != Input::TailStatus::Missing)
            {
                Utils::getLogger().warn("[" + m_target.name + "] " + m_target.logPath + " is missing, waiting for it");
            }

            std::uint64_t unrecognized = 0;
            for (const auto &line : result.lines)
            {
                Core::Event event = m_parser.parse(line);
                if (event.kind() == Core::EventKind::Unrecognized)
                {
                    ++unrecognized;
                }
                if (!m_sink(ServerMessage(std::move(event))))
                {
                    break;  // queue closed under us
                }
            }

            {
                std::lock_guard<std::mutex> lock(m_counterMutex);
                m_counters.lines += result.lines.size();
                m_counters.unrecognized += unrecognized;
                m_counters.rotations = m_tailer.rotations();
                if (result.status == Input::TailStatus::IoError)
                {
                    ++m_counters.ioErrors;
                }
            }

            m_lastStatus = result.status;
            checkpoint(false);
            return result.status;
        }

        void TailerTask::checkpoint(bool force)
        {
            const Core::LogCursor &cursor = m_tailer.cursor();
            if (cursor.fileIdentity.empty())
            {
                return;
            }
            if (cursor.byteOffset == m_checkpointedOffset && cursor.fileIdentity == m_checkpointedIdentity)
            {
                return;
            }

            const auto now = std::chrono::steady_clock::now();
            if (!force && now - m_lastCheckpoint < m_settings.cursorFlushInterval)
            {
                return;
            }

            if (m_sink(ServerMessage(CursorCheckpoint{cursor})))
            {
                m_checkpointedOffset   = cursor.byteOffset;
                m_checkpointedIdentity = cursor.fileIdentity;
                m_lastCheckpoint       = now;

                std::lock_guard<std::mutex> lock(m_counterMutex);
                ++m_counters.checkpoints;
            }
        }

        bool TailerTask::commit(const Core::LogCursor &cursor)
        {
            std::lock_guard<std::mutex> lock(m_commitMutex);
            if (!m_cursors.save(cursor))
            {
                Utils::getLogger().critical("[" + m_target.name + "] cannot persist cursor at offset " +
                                            std::to_string(cursor.byteOffset) + "; lines after the last saved "
                                            "cursor will be read again after a restart");
                return false;
            }

            std::lock_guard<std::mutex> counterLock(m_counterMutex);
            ++m_counters.commits;
            return true;
        }

        TailerCounters TailerTask::counters() const
        {
            std::lock_guard<std::mutex> lock(m_counterMutex);
            return m_counters;
        }

        std::chrono::milliseconds TailerTask::nextDelay(Input::TailStatus status)
        {
            switch (status)
            {
            case Input::TailStatus::Ok:
                m_backoff = m_settings.pollInterval;
                return std::chrono::milliseconds(0);
            case Input::TailStatus::NoData:
                m_backoff = m_settings.pollInterval;
                return m_settings.pollInterval;
            case Input::TailStatus::Missing:
            case Input::TailStatus::IoError:
            {
                const auto delay = m_backoff;
                m_backoff = std::min(m_backoff * 2, m_settings.missingFileBackoffMax);
                return delay;
            }
            }
            return m_settings.pollInterval;
        }

        void TailerTask::run()
        {
            Utils::getLogger().info("[" + m_target.name + "] tailing " + m_target.logPath);

            while (!m_stop)
            {
                Input::TailStatus status = Input::TailStatus::IoError;
                try
                {
                    status = pollOnce();
                }
                catch (const std::exception &ex)
                {
                    Utils::getLogger().error("[" + m_target.name + "] tailer cycle failed: " + ex.what());
                }

                const auto delay = nextDelay(status);
                if (delay.count() > 0)
                {
                    std::unique_lock<std::mutex> lock(m_waitMutex);
                    m_waitCv.wait_for(lock, delay, [this] { return m_stop.load(); });
                }
            }

            checkpoint(true);
            Utils::getLogger().info("[" + m_target.name + "] tailer stopped at offset " +
                                    std::to_string(m_tailer.cursor().byteOffset));
        }

    } // namespace Pipeline
} // namespace StatTrack
