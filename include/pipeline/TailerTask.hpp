#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/ServerTarget.hpp"
#include "input/CursorStore.hpp"
#include "input/EventParser.hpp"
#include "input/LogTailer.hpp"
#include "pipeline/EngineSettings.hpp"
#include "pipeline/ServerMessage.hpp"

namespace StatTrack
{
    namespace Pipeline
    {
        struct TailerCounters
        {
            std::uint64_t lines = 0;
            std::uint64_t unrecognized = 0;
            std::uint64_t checkpoints = 0;
            std::uint64_t commits = 0;
            std::uint64_t rotations = 0;
            std::uint64_t ioErrors = 0;
        };

        /**
         * TailerTask
         *
         * Responsibilities:
         *  - Poll one server's log file on its own thread, parse every new
         *    line and push the events onto the server's queue in file order.
         *  - Push a CursorCheckpoint after the lines it covers, at most once
         *    per cursor flush interval and once more when stopping.
         *  - Persist a checkpoint through its CursorStore when the tracker
         *    task commits it.
         *
         * Design notes:
         *  - A missing file is retried with a backoff that doubles from the
         *    poll interval up to the configured maximum; an I/O error is
         *    logged and retried the same way. Neither stops the task.
         *  - The saved cursor is only used when it was written for the same
         *    path; a cursor of a reconfigured path is ignored.
         *  - commit() is called from the tracker task's thread. The cursor
         *    store is only ever written by this class.
         */
        class TailerTask
        {
        public:
            /// Push one message; returns false once the queue is closed.
            using Sink = std::function<bool(ServerMessage)>;

            TailerTask(Core::ServerTarget target, Input::CursorStore &cursors,
                       const EngineSettings &settings, Sink sink);

            TailerTask(const TailerTask &)            = delete;
            TailerTask &operator=(const TailerTask &) = delete;

            ~TailerTask();

            void start();

            /// Push a final checkpoint and join the thread. Idempotent.
            void stop();

            bool isRunning() const noexcept { return m_thread.joinable(); }

            /// Run one poll on the calling thread; returns the tail status.
            Input::TailStatus pollOnce();

            /// Persist a checkpoint the tracker task has made durable.
            bool commit(const Core::LogCursor &cursor);

            TailerCounters counters() const;

            const std::string &serverId() const noexcept { return m_target.name; }

        private:
            void run();
            void checkpoint(bool force);
            std::chrono::milliseconds nextDelay(Input::TailStatus status);

        private:
            Core::ServerTarget  m_target;
            Input::CursorStore &m_cursors;
            EngineSettings      m_settings;
            Sink                m_sink;

            Input::LogTailer   m_tailer;
            Input::EventParser m_parser;
            bool               m_opened = false;

            std::chrono::milliseconds             m_backoff;
            std::chrono::steady_clock::time_point m_lastCheckpoint{};
            std::uint64_t                         m_checkpointedOffset = 0;
            std::string                           m_checkpointedIdentity;
            Input::TailStatus                     m_lastStatus = Input::TailStatus::NoData;

            mutable std::mutex m_counterMutex;
            TailerCounters     m_counters;
            std::mutex         m_commitMutex;

            std::atomic<bool>       m_stop{false};
            std::mutex              m_waitMutex;
            std::condition_variable m_waitCv;
            std::thread             m_thread;
        };

    } // namespace Pipeline
} // namespace StatTrack
