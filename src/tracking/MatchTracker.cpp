#include "tracking/MatchTracker.hpp"

#include <utility>

#include "core/LogCursor.hpp"
#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Tracking
    {
        using Core::EventKind;
        using Core::MatchState;
        using Core::Metric;

        // ------------------------------------------------------------
        // BatchBuilder
        // ------------------------------------------------------------

        MatchTracker::BatchBuilder::BatchBuilder(std::string key, std::string matchId, bool outOfRound)
            : m_matchId(std::move(matchId)),
              m_outOfRound(outOfRound)
        {
            m_batch.key = std::move(key);
        }

        void MatchTracker::BatchBuilder::add(const std::string &identity, const std::string &displayName,
                                             Metric metric, std::int64_t amount, const std::string &weapon)
        {
            if (Core::isWeaponMetric(metric) && weapon.empty())
            {
                return;
            }

            Core::StatDelta delta;
            delta.idempotencyKey = m_batch.key + ":" + std::to_string(m_batch.deltas.size());
            delta.matchId        = m_matchId;
            delta.identity       = identity;
            delta.displayName    = displayName;
            delta.metric         = metric;
            delta.weapon         = weapon;
            delta.amount         = amount;
            delta.outOfRound     = m_outOfRound;
            m_batch.deltas.push_back(std::move(delta));
        }

        // ------------------------------------------------------------
        // MatchTracker
        // ------------------------------------------------------------

        MatchTracker::MatchTracker(std::string serverId, TrackerOptions options)
            : m_serverId(std::move(serverId)),
              m_options(options),
              m_resolver(m_serverId, options.identityWindow)
        {
            if (m_options.snapshotMissThreshold < 1)
            {
                m_options.snapshotMissThreshold = 1;
            }
        }

        MatchState MatchTracker::phase() const noexcept
        {
            return m_match ? m_match->state : MatchState::Idle;
        }

        bool MatchTracker::inRound() const noexcept
        {
            return phase() == MatchState::RoundActive;
        }

        TrackerOutput MatchTracker::handle(const Core::Event &event)
        {
            TrackerOutput out;
            ++m_counters.events;
            if (event.kind() != EventKind::Unrecognized && (!m_lastLogTime || event.timestamp() > *m_lastLogTime))
            {
                m_lastLogTime = event.timestamp();
            }

            switch (event.kind())
            {
            case EventKind::Unrecognized:
                ++m_counters.unrecognized;
                break;
            case EventKind::PlayerConnect:
                onConnect(event, *event.as<Core::PlayerConnect>(), out);
                break;
            case EventKind::PlayerDisconnect:
                onDisconnect(event, *event.as<Core::PlayerDisconnect>(), out);
                break;
            case EventKind::Kill:
                onKill(event, *event.as<Core::Kill>(), out);
                break;
            case EventKind::Damage:
                onDamage(event, *event.as<Core::Damage>(), out);
                break;
            case EventKind::ChatMessage:
                onChat(event, *event.as<Core::ChatMessage>());
                break;
            case EventKind::RoundStart:
                onRoundStart(event, *event.as<Core::RoundStart>(), out);
                break;
            case EventKind::RoundEnd:
                onRoundEnd(event, *event.as<Core::RoundEnd>(), out);
                break;
            case EventKind::MapChange:
                onMapChange(event, *event.as<Core::MapChange>(), out);
                break;
            case EventKind::GameOver:
                onGameOver(event, out);
                break;
            case EventKind::ObjectiveCaptured:
                onObjective(event, event.as<Core::ObjectiveCaptured>()->players, Metric::ObjectivesCaptured, out);
                break;
            case EventKind::ObjectiveDestroyed:
                onObjective(event, event.as<Core::ObjectiveDestroyed>()->players, Metric::ObjectivesDestroyed, out);
                break;
            }

            for (const auto &batch : out.batches)
            {
                m_counters.deltas += batch.deltas.size();
            }
            return out;
        }

        // ---------- Lifecycle ----------

        void MatchTracker::onMapChange(const Core::Event &event, const Core::MapChange &change, TrackerOutput &out)
        {
            closeMatch(event.timestamp(), toString(EventKind::MapChange), out);
            openMatch(event.timestamp(), &change, toString(EventKind::MapChange), out);
        }

        void MatchTracker::onRoundStart(const Core::Event &event, const Core::RoundStart &start, TrackerOutput &out)
        {
            const char *cause = toString(EventKind::RoundStart);
            ensureMatch(event.timestamp(), cause, out);

            const MatchState state = phase();
            if (start.preRound)
            {
                if (state == MatchState::RoundEnd)
                {
                    transition(MatchState::Warmup, cause);
                }
                else if (state == MatchState::RoundActive)
                {
                    ++m_counters.ignoredTransitions;
                    Utils::getLogger().debug("[" + m_serverId + "] pre-round " + std::to_string(start.round) +
                                             " during an active round ignored");
                }
                return;
            }

            if (state == MatchState::RoundActive)
            {
                if (start.round == m_match->roundNumber)
                {
                    ++m_counters.ignoredTransitions;
                    return;
                }
                // The previous round never reported its end.
                ++m_match->roundsPlayed;
                transition(MatchState::RoundEnd, cause);
            }

            m_match->roundNumber = start.round > 0 ? start.round : m_match->roundNumber + 1;
            transition(MatchState::RoundActive, cause);
        }

        void MatchTracker::onRoundEnd(const Core::Event &event, const Core::RoundEnd &end, TrackerOutput &)
        {
            if (phase() != MatchState::RoundActive)
            {
                ++m_counters.ignoredTransitions;
                Utils::getLogger().trace("[" + m_serverId + "] round end in state " +
                                         std::string(toString(phase())) + " ignored");
                return;
            }

            ++m_match->roundsPlayed;
            m_match->winningTeam = end.winningTeam;
            transition(MatchState::RoundEnd, toString(EventKind::RoundEnd));
            Utils::getLogger().debug("[" + m_serverId + "] round " + std::to_string(m_match->roundNumber) +
                                     " over at " + Utils::formatGameTimestamp(event.timestamp()) +
                                     ", team " + std::to_string(end.winningTeam) + " won");
        }

        void MatchTracker::onGameOver(const Core::Event &, TrackerOutput &)
        {
            if (!m_match)
            {
                ++m_counters.ignoredTransitions;
                return;
            }
            if (phase() == MatchState::RoundActive)
            {
                ++m_match->roundsPlayed;
                transition(MatchState::RoundEnd, toString(EventKind::GameOver));
            }
            m_match->gameOver = true;
            Utils::getLogger().info("[" + m_serverId + "] match " + m_match->matchId + " over after " +
                                    std::to_string(m_match->roundsPlayed) + " round(s)");
        }

        void MatchTracker::openMatch(Utils::TimePoint at, const Core::MapChange *change, std::string_view cause,
                                     TrackerOutput &out)
        {
            Core::MatchRecord match;
            match.matchId   = Core::makeMatchId(m_serverId, at);
            match.serverId  = m_serverId;
            match.startedAt = at;
            match.state     = MatchState::Warmup;
            if (change != nullptr)
            {
                match.mapName  = change->mapName;
                match.scenario = change->scenario;
                match.lighting = change->lighting;
            }
            m_match = std::move(match);

            if (m_observer)
            {
                m_observer(MatchState::Idle, MatchState::Warmup, cause);
            }
            out.matchesOpened.push_back(*m_match);

            Utils::getLogger().info("[" + m_serverId + "] match " + m_match->matchId + " opened" +
                                    (m_match->mapName.empty() ? std::string(" (map unknown)")
                                                              : " on " + m_match->mapName +
                                                                    (m_match->scenario.empty() ? "" : " / " + m_match->scenario)));

            for (const auto &identity : m_connected)
            {
                openSession(identity, at, -1, out);
            }
        }

        void MatchTracker::closeMatch(Utils::TimePoint at, std::string_view cause, TrackerOutput &out)
        {
            if (!m_match)
            {
                return;
            }

            std::vector<std::string> open;
            for (const auto &entry : m_sessions)
            {
                open.push_back(entry.first);
            }
            for (const auto &identity : open)
            {
                closeSession(identity, at, out);
            }

            const MatchState from = m_match->state;
            m_match->state   = MatchState::Concluded;
            m_match->endedAt = at;
            if (m_observer)
            {
                m_observer(from, MatchState::Concluded, cause);
            }
            out.matchesClosed.push_back(*m_match);

            Utils::getLogger().info("[" + m_serverId + "] match " + m_match->matchId + " concluded, " +
                                    std::to_string(m_match->roundsPlayed) + " round(s) played");
            m_match.reset();
        }

        void MatchTracker::ensureMatch(Utils::TimePoint at, std::string_view cause, TrackerOutput &out)
        {
            if (!m_match)
            {
                Utils::getLogger().info("[" + m_serverId + "] " + std::string(cause) +
                                        " with no match open, starting an implicit match");
                openMatch(at, nullptr, cause, out);
            }
        }

        void MatchTracker::transition(MatchState to, std::string_view cause)
        {
            const MatchState from = phase();
            if (!m_match || from == to)
            {
                return;
            }
            m_match->state = to;
            if (m_observer)
            {
                m_observer(from, to, cause);
            }
            Utils::getLogger().trace("[" + m_serverId + "] " + toString(from) + " -> " + toString(to) +
                                     " on " + std::string(cause));
        }

        // ---------- Presence ----------

        void MatchTracker::onConnect(const Core::Event &event, const Core::PlayerConnect &connect, TrackerOutput &out)
        {
            const auto at = event.timestamp();
            std::string key;

            if (!connect.name.empty())
            {
                key = m_resolver.resolveName(connect.name, at);
                const Core::PlayerIdentity *identity = m_resolver.identity(key);
                if (identity != nullptr && identity->inGameId.empty())
                {
                    m_pendingIdLink = key;
                }
                else
                {
                    m_pendingIdLink.reset();
                }
            }
            else if (!connect.inGameId.empty())
            {
                if (m_pendingIdLink)
                {
                    const std::string pending = *m_pendingIdLink;
                    m_pendingIdLink.reset();

                    const auto known = m_resolver.findById(connect.inGameId);
                    if (known && *known != pending)
                    {
                        // Returning player: the name-only connect was this known id.
                        closeSession(pending, at, out);
                        m_connected.erase(pending);
                        m_misses.erase(pending);
                        key = *known;
                        m_resolver.markSeen(key, at);
                    }
                    else
                    {
                        m_resolver.linkId(pending, connect.inGameId);
                        key = pending;
                    }
                }
                else
                {
                    key = m_resolver.resolveId(connect.inGameId, at);
                }
            }
            else
            {
                return;
            }

            m_connected.insert(key);
            m_misses.erase(key);
            openSession(key, at, -1, out);
        }

        void MatchTracker::onDisconnect(const Core::Event &event, const Core::PlayerDisconnect &disconnect,
                                        TrackerOutput &out)
        {
            const auto key = !disconnect.inGameId.empty() ? m_resolver.findById(disconnect.inGameId)
                                                          : m_resolver.findByName(disconnect.name);
            if (!key)
            {
                Utils::getLogger().debug("[" + m_serverId + "] disconnect of unknown player " +
                                         (disconnect.inGameId.empty() ? disconnect.name : disconnect.inGameId));
                return;
            }

            closeSession(*key, event.timestamp(), out);
            m_connected.erase(*key);
            m_misses.erase(*key);
            if (m_pendingIdLink && *m_pendingIdLink == *key)
            {
                m_pendingIdLink.reset();
            }
        }

        void MatchTracker::onChat(const Core::Event &event, const Core::ChatMessage &chat)
        {
            if (const auto key = m_resolver.resolve(chat.sender, event.timestamp()))
            {
                Utils::getLogger().trace("[" + m_serverId + "] chat from " + *key +
                                         (chat.isCommand ? " (command)" : ""));
            }
        }

        std::optional<std::string> MatchTracker::participant(const Core::PlayerRef &ref, Utils::TimePoint at,
                                                             TrackerOutput &out)
        {
            auto key = m_resolver.resolve(ref, at);
            if (!key)
            {
                return std::nullopt;
            }

            m_connected.insert(*key);
            m_misses.erase(*key);
            openSession(*key, at, ref.team, out);

            auto it = m_sessions.find(*key);
            if (it != m_sessions.end() && ref.team >= 0)
            {
                it->second.team = ref.team;
            }
            return key;
        }

        void MatchTracker::openSession(const std::string &identity, Utils::TimePoint at, int team, TrackerOutput &out)
        {
            if (!m_match || m_sessions.count(identity) != 0)
            {
                return;
            }

            Core::PlayerSession session;
            session.serverId    = m_serverId;
            session.matchId     = m_match->matchId;
            session.identity    = identity;
            session.displayName = displayNameOf(identity, "");
            session.joinedAt    = at;
            session.team        = team;

            out.sessionsOpened.push_back(session);
            m_sessions.emplace(identity, std::move(session));
            Utils::getLogger().debug("[" + m_serverId + "] session opened for " + identity);
        }

        void MatchTracker::closeSession(const std::string &identity, Utils::TimePoint at, TrackerOutput &out)
        {
            auto it = m_sessions.find(identity);
            if (it == m_sessions.end())
            {
                return;
            }

            it->second.leftAt = at < it->second.joinedAt ? it->second.joinedAt : at;
            out.sessionsClosed.push_back(std::move(it->second));
            m_sessions.erase(it);
            Utils::getLogger().debug("[" + m_serverId + "] session closed for " + identity);
        }

        // ---------- Combat ----------

        void MatchTracker::onKill(const Core::Event &event, const Core::Kill &kill, TrackerOutput &out)
        {
            const auto at = event.timestamp();
            ensureMatch(at, toString(EventKind::Kill), out);

            const bool outOfRound = !inRound();
            if (outOfRound)
            {
                ++m_counters.outOfRoundEvents;
            }

            BatchBuilder batch(keyFor(event), m_match->matchId, outOfRound);

            const auto victim = participant(kill.victim, at, out);
            const auto killer = kill.killer ? participant(*kill.killer, at, out) : std::nullopt;
            const std::string victimName = victim ? displayNameOf(*victim, kill.victim.name) : "";
            const std::string killerName = killer ? displayNameOf(*killer, kill.killer->name) : "";

            if (killer && victim && *killer == *victim)
            {
                batch.add(*killer, killerName, Metric::Suicides);
                batch.add(*victim, victimName, Metric::Deaths);
            }
            else if (killer && victim && kill.killer->team >= 0 && kill.killer->team == kill.victim.team)
            {
                batch.add(*killer, killerName, Metric::FriendlyFireKills);
                batch.add(*victim, victimName, Metric::Deaths);
            }
            else
            {
                if (killer)
                {
                    batch.add(*killer, killerName, Metric::Kills);
                    if (kill.headshot)
                    {
                        batch.add(*killer, killerName, Metric::Headshots);
                    }
                    batch.add(*killer, killerName, Metric::WeaponKills, 1, kill.weapon);
                    if (kill.headshot)
                    {
                        batch.add(*killer, killerName, Metric::WeaponHeadshots, 1, kill.weapon);
                    }
                }
                for (const auto &assister : kill.assisters)
                {
                    const auto key = participant(assister, at, out);
                    if (!key || (killer && *key == *killer))
                    {
                        continue;
                    }
                    const std::string name = displayNameOf(*key, assister.name);
                    batch.add(*key, name, Metric::Assists);
                    batch.add(*key, name, Metric::WeaponAssists, 1, kill.weapon);
                }
                if (victim)
                {
                    batch.add(*victim, victimName, Metric::Deaths);
                }
            }

            auto built = batch.take();
            if (!built.empty())
            {
                out.batches.push_back(std::move(built));
            }
        }

        void MatchTracker::onDamage(const Core::Event &event, const Core::Damage &damage, TrackerOutput &out)
        {
            const auto at = event.timestamp();
            ensureMatch(at, toString(EventKind::Damage), out);

            const bool outOfRound = !inRound();
            if (outOfRound)
            {
                ++m_counters.outOfRoundEvents;
            }
            if (damage.amount <= 0)
            {
                return;
            }

            BatchBuilder batch(keyFor(event), m_match->matchId, outOfRound);
            if (const auto attacker = participant(damage.attacker, at, out))
            {
                batch.add(*attacker, displayNameOf(*attacker, damage.attacker.name), Metric::DamageDealt,
                          damage.amount);
            }
            if (const auto victim = participant(damage.victim, at, out))
            {
                batch.add(*victim, displayNameOf(*victim, damage.victim.name), Metric::DamageTaken,
                          damage.amount);
            }

            auto built = batch.take();
            if (!built.empty())
            {
                out.batches.push_back(std::move(built));
            }
        }

        void MatchTracker::onObjective(const Core::Event &event, const std::vector<Core::PlayerRef> &players,
                                       Metric metric, TrackerOutput &out)
        {
            const auto at = event.timestamp();
            ensureMatch(at, toString(event.kind()), out);

            BatchBuilder batch(keyFor(event), m_match->matchId, !inRound());
            for (const auto &player : players)
            {
                if (const auto key = participant(player, at, out))
                {
                    batch.add(*key, displayNameOf(*key, player.name), metric);
                }
            }

            auto built = batch.take();
            if (!built.empty())
            {
                out.batches.push_back(std::move(built));
            }
        }

        // ---------- Snapshots ----------

        std::string MatchTracker::snapshotIdentity(const std::string &name, Utils::TimePoint at)
        {
            const Core::PlayerIdentity *best = nullptr;
            for (const auto &key : m_connected)
            {
                const Core::PlayerIdentity *identity = m_resolver.identity(key);
                if (identity != nullptr && identity->displayName == name &&
                    (best == nullptr || identity->lastSeen > best->lastSeen))
                {
                    best = identity;
                }
            }
            if (best != nullptr)
            {
                const std::string key = best->key;
                m_resolver.markSeen(key, at);
                return key;
            }
            return m_resolver.resolveSnapshotName(name, at);
        }

        TrackerOutput MatchTracker::mergeSnapshot(const Core::LiveSnapshot &snapshot)
        {
            TrackerOutput out;
            ++m_counters.snapshots;

            if (!snapshot.reachable)
            {
                Utils::getLogger().trace("[" + m_serverId + "] unreachable snapshot ignored");
                return out;
            }

            const auto at = m_lastLogTime.value_or(snapshot.queriedAt);
            std::set<std::string> present;
            for (const auto &player : snapshot.players)
            {
                if (player.name.empty())
                {
                    continue;
                }
                const std::string key = snapshotIdentity(player.name, at);
                present.insert(key);

                if (m_connected.insert(key).second || m_sessions.count(key) == 0)
                {
                    if (m_match && m_sessions.count(key) == 0)
                    {
                        Utils::getLogger().debug("[" + m_serverId + "] " + player.name +
                                                 " seen in snapshot without a session");
                    }
                    openSession(key, at, -1, out);
                }
            }

            std::vector<std::string> gone;
            for (const auto &key : m_connected)
            {
                if (present.count(key) != 0)
                {
                    m_misses.erase(key);
                    auto it = m_sessions.find(key);
                    if (it != m_sessions.end())
                    {
                        it->second.snapshotMisses = 0;
                    }
                    continue;
                }

                const int misses = ++m_misses[key];
                auto it = m_sessions.find(key);
                if (it != m_sessions.end())
                {
                    it->second.snapshotMisses = misses;
                }
                if (misses >= m_options.snapshotMissThreshold)
                {
                    gone.push_back(key);
                }
            }

            for (const auto &key : gone)
            {
                Utils::getLogger().debug("[" + m_serverId + "] " + key + " missing from " +
                                         std::to_string(m_options.snapshotMissThreshold) +
                                         " snapshots, closing session");
                closeSession(key, at, out);
                m_connected.erase(key);
                m_misses.erase(key);
            }
            return out;
        }

        bool MatchTracker::restore(const Core::MatchRecord &match,
                                   const std::vector<Core::PlayerSession> &openSessions)
        {
            if (m_match || !match.isOpen() || match.serverId != m_serverId)
            {
                return false;
            }

            m_match = match;
            Utils::TimePoint latest = match.startedAt;
            for (const auto &stored : openSessions)
            {
                if (stored.matchId != match.matchId || !stored.isOpen())
                {
                    continue;
                }
                m_resolver.remember(stored.identity, stored.displayName, stored.joinedAt);
                m_sessions[stored.identity] = stored;
                m_connected.insert(stored.identity);
                if (stored.joinedAt > latest)
                {
                    latest = stored.joinedAt;
                }
            }
            if (!m_lastLogTime || latest > *m_lastLogTime)
            {
                m_lastLogTime = latest;
            }

            Utils::getLogger().info("[" + m_serverId + "] resuming match " + match.matchId + " in " +
                                    toString(match.state) + " after round " + std::to_string(match.roundNumber) +
                                    " with " + std::to_string(m_sessions.size()) + " open session(s)");
            return true;
        }

        // ---------- Helpers ----------

        std::string MatchTracker::displayNameOf(const std::string &identity, const std::string &fallback) const
        {
            const Core::PlayerIdentity *known = m_resolver.identity(identity);
            if (known != nullptr && !known->displayName.empty())
            {
                return known->displayName;
            }
            return fallback;
        }

        std::string MatchTracker::keyFor(const Core::Event &event)
        {
            const Core::LineRef &source = event.source();
            if (!source.fileIdentity.empty())
            {
                return Core::lineKey(source.fileIdentity, source.startOffset);
            }
            // Events built in memory have no position; they are never replayed.
            return "mem:" + m_serverId + "@" + std::to_string(++m_sequence);
        }

    } // namespace Tracking
} // namespace StatTrack
