#include "tracking/IdentityResolver.hpp"

#include <algorithm>
#include <utility>

#include "utils/Logger.hpp"

namespace StatTrack
{
    namespace Tracking
    {
        namespace
        {
            std::chrono::milliseconds distance(Utils::TimePoint a, Utils::TimePoint b)
            {
                const auto d = std::chrono::duration_cast<std::chrono::milliseconds>(a - b);
                return d.count() < 0 ? -d : d;
            }
        } // namespace

        IdentityResolver::IdentityResolver(std::string serverId,
                                           std::chrono::seconds window,
                                           std::size_t maxAmbiguities)
            : m_serverId(std::move(serverId)),
              m_window(window),
              m_maxAmbiguities(maxAmbiguities)
        {
        }

        std::optional<std::string> IdentityResolver::resolve(const Core::PlayerRef &ref, Utils::TimePoint at)
        {
            if (ref.isBot())
            {
                return std::nullopt;
            }

            if (ref.hasId())
            {
                auto byId = m_byId.find(ref.inGameId);
                if (byId != m_byId.end())
                {
                    touch(m_identities.at(byId->second), ref.name, at);
                    return byId->second;
                }

                // A name-only connect earlier: adopt it instead of splitting the player.
                auto byName = m_byName.find(ref.name);
                if (byName != m_byName.end())
                {
                    std::vector<std::string> idless;
                    for (const auto &key : byName->second)
                    {
                        if (m_identities.at(key).inGameId.empty())
                        {
                            idless.push_back(key);
                        }
                    }
                    if (!idless.empty())
                    {
                        const std::string key = pick(ref.name, idless, at);
                        linkId(key, ref.inGameId);
                        touch(m_identities.at(key), ref.name, at);
                        return key;
                    }
                }

                return create("id:" + ref.inGameId, ref.name, ref.inGameId, at).key;
            }

            if (ref.name.empty())
            {
                return std::nullopt;
            }
            return resolveName(ref.name, at);
        }

        std::string IdentityResolver::resolveName(const std::string &displayName, Utils::TimePoint at)
        {
            auto it = m_byName.find(displayName);
            if (it == m_byName.end() || it->second.empty())
            {
                return create("name:" + displayName, displayName, "", at).key;
            }

            const std::string key = pick(displayName, it->second, at);
            touch(m_identities.at(key), displayName, at);
            return key;
        }

        std::string IdentityResolver::resolveId(const std::string &inGameId, Utils::TimePoint at)
        {
            auto it = m_byId.find(inGameId);
            if (it != m_byId.end())
            {
                touch(m_identities.at(it->second), "", at);
                return it->second;
            }
            return create("id:" + inGameId, "", inGameId, at).key;
        }

        std::string IdentityResolver::resolveSnapshotName(const std::string &displayName, Utils::TimePoint at)
        {
            std::vector<std::string> recent;
            auto it = m_byName.find(displayName);
            if (it != m_byName.end())
            {
                for (const auto &key : it->second)
                {
                    if (distance(at, m_identities.at(key).lastSeen) <= m_window)
                    {
                        recent.push_back(key);
                    }
                }
            }

            if (!recent.empty())
            {
                const std::string key = pick(displayName, recent, at);
                touch(m_identities.at(key), displayName, at);
                return key;
            }

            // Nobody with that name was active lately; do not attach the row
            // to a stale id-keyed identity.
            const std::string nameKey = "name:" + displayName;
            auto existing = m_identities.find(nameKey);
            if (existing != m_identities.end())
            {
                touch(existing->second, displayName, at);
                return nameKey;
            }
            return create(nameKey, displayName, "", at).key;
        }

        bool IdentityResolver::linkId(const std::string &key, const std::string &inGameId)
        {
            auto it = m_identities.find(key);
            if (it == m_identities.end() || inGameId.empty())
            {
                return false;
            }

            auto owner = m_byId.find(inGameId);
            if (owner != m_byId.end())
            {
                return owner->second == key;
            }
            if (!it->second.inGameId.empty())
            {
                Utils::getLogger().warn("[" + m_serverId + "] identity " + key + " already has id " +
                                        it->second.inGameId + ", not linking " + inGameId);
                return false;
            }

            it->second.inGameId = inGameId;
            m_byId[inGameId]    = key;
            Utils::getLogger().debug("[" + m_serverId + "] linked id " + inGameId + " to " + key);
            return true;
        }

        void IdentityResolver::remember(const std::string &key, const std::string &displayName, Utils::TimePoint at)
        {
            std::string inGameId;
            if (key.compare(0, 3, "id:") == 0)
            {
                inGameId = key.substr(3);
            }
            create(key, displayName, inGameId, at);
        }

        void IdentityResolver::markSeen(const std::string &key, Utils::TimePoint at)
        {
            auto it = m_identities.find(key);
            if (it != m_identities.end())
            {
                touch(it->second, "", at);
            }
        }

        std::optional<std::string> IdentityResolver::findById(const std::string &inGameId) const
        {
            auto it = m_byId.find(inGameId);
            if (it == m_byId.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> IdentityResolver::findByName(const std::string &displayName) const
        {
            auto it = m_byName.find(displayName);
            if (it == m_byName.end() || it->second.empty())
            {
                return std::nullopt;
            }

            const std::string *best = nullptr;
            for (const auto &key : it->second)
            {
                if (best == nullptr || m_identities.at(key).lastSeen > m_identities.at(*best).lastSeen)
                {
                    best = &key;
                }
            }
            return *best;
        }

        const Core::PlayerIdentity *IdentityResolver::identity(const std::string &key) const
        {
            auto it = m_identities.find(key);
            return it == m_identities.end() ? nullptr : &it->second;
        }

        Core::PlayerIdentity &IdentityResolver::create(const std::string &key, const std::string &displayName,
                                                       const std::string &inGameId, Utils::TimePoint at)
        {
            auto it = m_identities.find(key);
            if (it != m_identities.end())
            {
                touch(it->second, displayName, at);
                return it->second;
            }

            Core::PlayerIdentity identity;
            identity.key         = key;
            identity.displayName = displayName;
            identity.inGameId    = inGameId;
            identity.lastSeen    = at;
            it = m_identities.emplace(key, std::move(identity)).first;

            if (!displayName.empty())
            {
                m_byName[displayName].push_back(key);
            }
            if (!inGameId.empty())
            {
                m_byId[inGameId] = key;
            }

            Utils::getLogger().trace("[" + m_serverId + "] new identity " + key);
            return it->second;
        }

        void IdentityResolver::touch(Core::PlayerIdentity &identity, const std::string &displayName,
                                     Utils::TimePoint at)
        {
            if (!displayName.empty() && displayName != identity.displayName)
            {
                if (!identity.displayName.empty())
                {
                    auto old = m_byName.find(identity.displayName);
                    if (old != m_byName.end())
                    {
                        auto &keys = old->second;
                        keys.erase(std::remove(keys.begin(), keys.end(), identity.key), keys.end());
                        if (keys.empty())
                        {
                            m_byName.erase(old);
                        }
                    }
                }
                identity.displayName = displayName;
                m_byName[displayName].push_back(identity.key);
            }
            if (at > identity.lastSeen)
            {
                identity.lastSeen = at;
            }
        }

        std::string IdentityResolver::pick(const std::string &displayName,
                                           const std::vector<std::string> &keys,
                                           Utils::TimePoint at)
        {
            std::string chosen = keys.front();
            for (const auto &key : keys)
            {
                if (m_identities.at(key).lastSeen > m_identities.at(chosen).lastSeen)
                {
                    chosen = key;
                }
            }
            if (keys.size() == 1)
            {
                return chosen;
            }

            IdentityAmbiguity ambiguity;
            ambiguity.displayName = displayName;
            ambiguity.candidates  = keys;
            ambiguity.chosen      = chosen;
            ambiguity.at          = at;
            m_ambiguities.push_back(std::move(ambiguity));
            while (m_ambiguities.size() > m_maxAmbiguities)
            {
                m_ambiguities.pop_front();
            }

            if (m_warnedNames.insert(displayName).second)
            {
                Utils::getLogger().warn("[" + m_serverId + "] display name '" + displayName + "' matches " +
                                        std::to_string(keys.size()) + " identities, using " + chosen);
            }
            return chosen;
        }

    } // namespace Tracking
} // namespace StatTrack
