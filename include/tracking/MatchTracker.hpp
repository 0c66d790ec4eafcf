#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "core/Event.hpp"
#include "core/LiveSnapshot.hpp"
#include "core/Match.hpp"
#include "core/StatDelta.hpp"
#include "tracking/IdentityResolver.hpp"

namespace StatTrack
{
    namespace Tracking
    {
        struct TrackerOptions
        {
            int                  snapshotMissThreshold = 3;  ///< Consecutive misses that close a session.
            std::chrono::seconds identityWindow{300};
        };

        /**
         * Everything one input message caused, in the order it happened.
         * The owning task forwards it to the stats store.
         */
        struct TrackerOutput
        {
            std::vector<Core::MatchRecord>   matchesOpened;
            std::vector<Core::MatchRecord>   matchesClosed;
            std::vector<Core::StatBatch>     batches;
            std::vector<Core::PlayerSession> sessionsOpened;
            std::vector<Core::PlayerSession> sessionsClosed;

            bool empty() const noexcept
            {
                return matchesOpened.empty() && matchesClosed.empty() && batches.empty() &&
                       sessionsOpened.empty() && sessionsClosed.empty();
            }
        };

        struct TrackerCounters
        {
            std::uint64_t events = 0;
            std::uint64_t unrecognized = 0;
            std::uint64_t outOfRoundEvents = 0;  ///< Kill/Damage outside an active round.
            std::uint64_t ignoredTransitions = 0;
            std::uint64_t snapshots = 0;
            std::uint64_t deltas = 0;
        };

        /**
         * MatchTracker
         *
         * Responsibilities:
         *  - Own the match state machine of one server:
         *      Idle -> Warmup -> RoundActive -> RoundEnd -> (Warmup | RoundActive)
         *    with MapChange closing the current match and opening the next.
         *  - Turn kills, damage and objectives into StatDeltas keyed by the
         *    position of the line they came from.
         *  - Keep player sessions from connect/disconnect lines and merge
         *    live snapshots into them.
         *
         * Design notes:
         *  - Single-threaded: the owning task feeds events and snapshots in
         *    arrival order, so no locking is needed.
         *  - Combat events outside an active round are still attributed to
         *    the current match and flagged outOfRound.
         *  - Combat with no match open (tailer started mid-match) opens an
         *    implicit match with an unknown map.
         *  - Transitions that are illegal for the current state are ignored
         *    and counted, never forced.
         *  - Snapshot-driven changes are stamped with the latest log time, not
         *    the query time, so a backlog being replayed never sees sessions
         *    or identities dated in its future.
         *  - Stopping the daemon does not end a match. The owner saves its
         *    progress and a later run restore()s it; the next MapChange
         *    concludes it as usual.
         */
        class MatchTracker
        {
        public:
            using TransitionObserver =
                std::function<void(Core::MatchState from, Core::MatchState to, std::string_view cause)>;

            explicit MatchTracker(std::string serverId, TrackerOptions options = TrackerOptions{});

            MatchTracker(const MatchTracker &)            = delete;
            MatchTracker &operator=(const MatchTracker &) = delete;

            /// Apply one parsed event.
            TrackerOutput handle(const Core::Event &event);

            /// Merge the latest query result. Unreachable snapshots change nothing.
            TrackerOutput mergeSnapshot(const Core::LiveSnapshot &snapshot);

            /**
             * Continue a match that an earlier run left open, with the sessions
             * it still had open. Call before the first event. False (and no
             * change) when a match is already open or the record is concluded
             * or belongs to another server.
             */
            bool restore(const Core::MatchRecord &match, const std::vector<Core::PlayerSession> &openSessions);

            /// Latest timestamp seen on a log line (or restored); nullopt before that.
            const std::optional<Utils::TimePoint> &lastLogTime() const noexcept { return m_lastLogTime; }

            /// Current phase; Idle when no match is open.
            Core::MatchState phase() const noexcept;

            const std::optional<Core::MatchRecord> &currentMatch() const noexcept { return m_match; }

            /// Open sessions keyed by identity.
            const std::map<std::string, Core::PlayerSession> &sessions() const noexcept { return m_sessions; }

            const IdentityResolver &resolver() const noexcept { return m_resolver; }
            const TrackerCounters &counters() const noexcept { return m_counters; }
            const std::string &serverId() const noexcept { return m_serverId; }

            void setTransitionObserver(TransitionObserver observer) { m_observer = std::move(observer); }

        private:
            // Per-line delta builder: keys are "<lineKey>:<ordinal>".
            class BatchBuilder
            {
            public:
                BatchBuilder(std::string key, std::string matchId, bool outOfRound);

                void add(const std::string &identity, const std::string &displayName,
                         Core::Metric metric, std::int64_t amount = 1, const std::string &weapon = "");

                Core::StatBatch take() { return std::move(m_batch); }

            private:
                Core::StatBatch m_batch;
                std::string     m_matchId;
                bool            m_outOfRound;
            };

            void onMapChange(const Core::Event &event, const Core::MapChange &change, TrackerOutput &out);
            void onRoundStart(const Core::Event &event, const Core::RoundStart &start, TrackerOutput &out);
            void onRoundEnd(const Core::Event &event, const Core::RoundEnd &end, TrackerOutput &out);
            void onGameOver(const Core::Event &event, TrackerOutput &out);
            void onConnect(const Core::Event &event, const Core::PlayerConnect &connect, TrackerOutput &out);
            void onDisconnect(const Core::Event &event, const Core::PlayerDisconnect &disconnect, TrackerOutput &out);
            void onKill(const Core::Event &event, const Core::Kill &kill, TrackerOutput &out);
            void onDamage(const Core::Event &event, const Core::Damage &damage, TrackerOutput &out);
            void onObjective(const Core::Event &event, const std::vector<Core::PlayerRef> &players,
                             Core::Metric metric, TrackerOutput &out);
            void onChat(const Core::Event &event, const Core::ChatMessage &chat);

            void openMatch(Utils::TimePoint at, const Core::MapChange *change, std::string_view cause,
                           TrackerOutput &out);
            void closeMatch(Utils::TimePoint at, std::string_view cause, TrackerOutput &out);
            void ensureMatch(Utils::TimePoint at, std::string_view cause, TrackerOutput &out);
            void transition(Core::MatchState to, std::string_view cause);

            /// Resolve a participant and make sure it has a session. nullopt for bots.
            std::optional<std::string> participant(const Core::PlayerRef &ref, Utils::TimePoint at,
                                                   TrackerOutput &out);

            void openSession(const std::string &identity, Utils::TimePoint at, int team, TrackerOutput &out);
            void closeSession(const std::string &identity, Utils::TimePoint at, TrackerOutput &out);

            /// Identity for a snapshot row, preferring players already on the server.
            std::string snapshotIdentity(const std::string &name, Utils::TimePoint at);

            std::string displayNameOf(const std::string &identity, const std::string &fallback) const;
            std::string keyFor(const Core::Event &event);
            bool inRound() const noexcept;

        private:
            std::string                                m_serverId;
            TrackerOptions                             m_options;
            IdentityResolver                           m_resolver;
            std::optional<Core::MatchRecord>           m_match;
            std::map<std::string, Core::PlayerSession> m_sessions;   // open sessions of m_match
            std::set<std::string>                      m_connected;  // identities on the server
            std::map<std::string, int>                 m_misses;     // consecutive snapshot misses
            std::optional<std::string>                 m_pendingIdLink;
            std::uint64_t                              m_sequence = 0;
            std::optional<Utils::TimePoint>            m_lastLogTime;
            TrackerCounters                            m_counters;
            TransitionObserver                         m_observer;
        };

    } // namespace Tracking
} // namespace StatTrack
