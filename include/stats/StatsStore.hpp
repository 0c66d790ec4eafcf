#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Match.hpp"
#include "core/StatDelta.hpp"

namespace StatTrack
{
    namespace Stats
    {
        /// Thrown when a store cannot be opened at all.
        class StoreError : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        enum class UpsertResult
        {
            Applied,    ///< State changed.
            Duplicate,  ///< Already applied earlier; nothing changed.
            Failed,     ///< Could not be persisted; safe to retry.
        };

        const char *toString(UpsertResult result) noexcept;

        /**
         * StatsStore
         *
         * Durable home of match records and player aggregates.
         *
         * Contract:
         *  - Every mutating call is idempotent. Deltas are deduplicated by
         *    their idempotency key, separately for the per-match and the
         *    all-time table; matches by their id.
         *  - closeMatch() of an unknown match records it as concluded, so
         *    replay order between open and close does not matter.
         *  - saveMatchProgress() updates the round state of an open match and
         *    never reopens a concluded one. activeMatch() returns what was
         *    saved, which lets a restarted tracker continue the same match.
         *  - Sessions are keyed by (match, identity, join time): a rejoin is a
         *    new session, a replayed join is a duplicate.
         *  - Implementations are shared by every server's tracker task and
         *    must be thread-safe.
         */
        class StatsStore
        {
        public:
            virtual ~StatsStore() = default;

            virtual UpsertResult openMatch(const Core::MatchRecord &match) = 0;
            virtual UpsertResult closeMatch(const Core::MatchRecord &match) = 0;
            virtual UpsertResult saveMatchProgress(const Core::MatchRecord &match) = 0;

            virtual UpsertResult openSession(const Core::PlayerSession &session) = 0;
            /// Records leftAt (joinedAt when unset); an unknown session is stored closed.
            virtual UpsertResult closeSession(const Core::PlayerSession &session) = 0;

            virtual UpsertResult upsertPlayerMatchStats(const Core::StatDelta &delta) = 0;
            virtual UpsertResult upsertAllTimeStats(const Core::StatDelta &delta) = 0;

            /// Make everything accepted so far durable. False if that failed.
            virtual bool flush() = 0;

            virtual std::optional<Core::MatchRecord> match(const std::string &matchId) const = 0;
            virtual std::vector<Core::MatchRecord> matches() const = 0;

            /// Most recently started match of a server that is not concluded.
            virtual std::optional<Core::MatchRecord> activeMatch(const std::string &serverId) const = 0;

            /// Sessions of one match ordered by identity, then join time.
            virtual std::vector<Core::PlayerSession> sessions(const std::string &matchId) const = 0;

            virtual std::optional<Core::PlayerMatchStats> playerMatchStats(const std::string &matchId,
                                                                           const std::string &identity) const = 0;
            /// All rows of one match, ordered by identity.
            virtual std::vector<Core::PlayerMatchStats> matchStats(const std::string &matchId) const = 0;

            virtual std::optional<Core::PlayerMatchStats> allTimeStats(const std::string &identity) const = 0;
            /// All all-time rows, ordered by identity.
            virtual std::vector<Core::PlayerMatchStats> allTime() const = 0;
        };

    } // namespace Stats
} // namespace StatTrack
