#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/Event.hpp"
#include "core/Match.hpp"
#include "utils/TimeUtils.hpp"

namespace StatTrack
{
    namespace Tracking
    {
        /// One display name that matched more than one known identity.
        struct IdentityAmbiguity
        {
            std::string              displayName;
            std::vector<std::string> candidates;  ///< Identity keys sharing the name.
            std::string              chosen;      ///< Most recently active candidate.
            Utils::TimePoint         at{};
        };

        /**
         * IdentityResolver
         *
         * Responsibilities:
         *  - Turn what a log line says about a player (display name and,
         *    when present, the in-game id) into one canonical identity key.
         *  - Link an in-game id that arrives on a later line to the identity
         *    created from an earlier name-only connect.
         *  - Match snapshot player names (no id at all) to known identities
         *    within a short time window.
         *
         * Design notes:
         *  - Keys never change once assigned ("id:<id>" or "name:<name>"),
         *    so stats rows stay attached to one key across renames.
         *  - Ambiguous names resolve to the most recently active identity and
         *    are recorded in a bounded list for operators, never merged.
         *  - One instance per server; not thread-safe (owned by the tracker).
         */
        class IdentityResolver
        {
        public:
            explicit IdentityResolver(std::string serverId,
                                      std::chrono::seconds window = std::chrono::seconds(300),
                                      std::size_t maxAmbiguities = 64);

            IdentityResolver(const IdentityResolver &)            = delete;
            IdentityResolver &operator=(const IdentityResolver &) = delete;

            /**
             * Resolve a player reference from a log line. Bots (id INVALID)
             * are not tracked and yield std::nullopt, as does an empty name
             * without an id.
             */
            std::optional<std::string> resolve(const Core::PlayerRef &ref, Utils::TimePoint at);

            /// Name-only resolution; creates "name:<name>" when nothing matches.
            std::string resolveName(const std::string &displayName, Utils::TimePoint at);

            /// Id-only resolution; creates "id:<id>" when the id is unknown.
            std::string resolveId(const std::string &inGameId, Utils::TimePoint at);

            /// Identity for a snapshot row: recent same-name identity, else resolveName().
            std::string resolveSnapshotName(const std::string &displayName, Utils::TimePoint at);

            /// Attach an in-game id to an existing identity. False if the id already
            /// belongs to another identity or the key is unknown.
            bool linkId(const std::string &key, const std::string &inGameId);

            /// Re-learn an identity by its key, e.g. from a stored session.
            void remember(const std::string &key, const std::string &displayName, Utils::TimePoint at);

            /// Refresh lastSeen of a known identity.
            void markSeen(const std::string &key, Utils::TimePoint at);

            std::optional<std::string> findById(const std::string &inGameId) const;
            std::optional<std::string> findByName(const std::string &displayName) const;

            const Core::PlayerIdentity *identity(const std::string &key) const;

            std::size_t size() const noexcept { return m_identities.size(); }

            /// Recent ambiguous resolutions, oldest first.
            const std::deque<IdentityAmbiguity> &ambiguities() const noexcept { return m_ambiguities; }

        private:
            Core::PlayerIdentity &create(const std::string &key, const std::string &displayName,
                                         const std::string &inGameId, Utils::TimePoint at);

            void touch(Core::PlayerIdentity &identity, const std::string &displayName, Utils::TimePoint at);

            /// Most recently seen identity among keys; records an ambiguity if several.
            std::string pick(const std::string &displayName, const std::vector<std::string> &keys,
                             Utils::TimePoint at);

        private:
            std::string                                     m_serverId;
            std::chrono::seconds                            m_window;
            std::size_t                                     m_maxAmbiguities;
            std::map<std::string, Core::PlayerIdentity>     m_identities;  // by key
            std::map<std::string, std::vector<std::string>> m_byName;      // display name -> keys
            std::map<std::string, std::string>              m_byId;        // in-game id -> key
            std::deque<IdentityAmbiguity>                   m_ambiguities;
            std::set<std::string>                           m_warnedNames;
        };

    } // namespace Tracking
} // namespace StatTrack
