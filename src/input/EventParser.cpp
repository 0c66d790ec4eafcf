#include "input/EventParser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "utils/StringUtils.hpp"

namespace StatTrack
{
    namespace Input
    {
        namespace
        {
            using SvMatch = std::match_results<std::string_view::const_iterator>;

            bool matchBody(std::string_view body, const std::regex &re, SvMatch &m)
            {
                return std::regex_match(body.begin(), body.end(), m, re);
            }

            bool searchBody(std::string_view body, const std::regex &re, SvMatch &m)
            {
                return std::regex_search(body.begin(), body.end(), m, re);
            }

            std::string group(const SvMatch &m, std::size_t i)
            {
                return m[i].matched ? std::string(Utils::trim(m[i].str())) : std::string();
            }

            int groupInt(const SvMatch &m, std::size_t i, int fallback = -1)
            {
                const auto v = Utils::parseInteger<int>(group(m, i));
                return v ? *v : fallback;
            }
        } // namespace

        // ------------------------------------------------------------
        // Matchers
        // ------------------------------------------------------------

        namespace Matchers
        {
            std::optional<Core::Event> mapChange(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogLoad: LoadMap: /Game/Maps/([^/?]+)(?:/[^?]*)?(?:\?(.*))?$)");

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::MapChange ev;
                ev.mapName = group(m, 1);

                // Travel options: "?Name=Player?Scenario=...?MaxPlayers=28?Lighting=Day"
                const std::string options = group(m, 2);
                for (std::string_view opt : Utils::split(options, "?"))
                {
                    const auto eq = opt.find('=');
                    if (eq == std::string_view::npos)
                    {
                        continue;
                    }
                    const std::string_view key   = opt.substr(0, eq);
                    const std::string_view value = opt.substr(eq + 1);
                    if (key == "Scenario")
                    {
                        ev.scenario = std::string(value);
                    }
                    else if (key == "Lighting")
                    {
                        ev.lighting = std::string(value);
                    }
                    else if (key == "MaxPlayers")
                    {
                        ev.maxPlayers = Utils::parseInteger<int>(value).value_or(0);
                    }
                }

                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> objectiveDestroyed(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogGameplayEvents: Display: Objective (\d+) owned by team (\d+) was destroyed for team (\d+) by (.+)\.\s*$)");

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::ObjectiveDestroyed ev;
                ev.objective      = groupInt(m, 1, 0);
                ev.owningTeam     = groupInt(m, 2);
                ev.destroyingTeam = groupInt(m, 3);
                ev.players        = EventParser::parsePlayerList(group(m, 4));
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> objectiveCaptured(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogGameplayEvents: Display: Objective (\d+) was captured for team (\d+) from team (\d+) by (.+)\.\s*$)");

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::ObjectiveCaptured ev;
                ev.objective     = groupInt(m, 1, 0);
                ev.capturingTeam = groupInt(m, 2);
                ev.losingTeam    = groupInt(m, 3);
                ev.players       = EventParser::parsePlayerList(group(m, 4));
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> kill(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogGameplayEvents: Display: (.+?) killed ([^\[]+)\[([^,\]]*), team (\d+)\] with (.+)$)");
                static constexpr std::string_view kHeadshot = " (headshot)";

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::Kill ev;

                auto killers = EventParser::parsePlayerList(group(m, 1));
                if (!killers.empty())
                {
                    ev.killer = std::move(killers.front());
                    ev.assisters.assign(std::make_move_iterator(killers.begin() + 1),
                                        std::make_move_iterator(killers.end()));
                }

                ev.victim.name     = group(m, 2);
                ev.victim.inGameId = group(m, 3);
                ev.victim.team     = groupInt(m, 4);

                std::string weapon = group(m, 5);
                if (Utils::endsWith(weapon, kHeadshot))
                {
                    ev.headshot = true;
                    weapon.resize(weapon.size() - kHeadshot.size());
                }
                ev.weapon = EventParser::normalizeWeapon(weapon);

                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> damage(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogGameplayEvents: Display: (.+?)\[([^,\]]*), team (\d+)\] damaged ([^\[]+)\[([^,\]]*), team (\d+)\] for (\d+) with (.+)$)");

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::Damage ev;
                ev.attacker.name     = group(m, 1);
                ev.attacker.inGameId = group(m, 2);
                ev.attacker.team     = groupInt(m, 3);
                ev.victim.name       = group(m, 4);
                ev.victim.inGameId   = group(m, 5);
                ev.victim.team       = groupInt(m, 6);
                ev.amount            = Utils::parseInteger<std::int64_t>(group(m, 7)).value_or(0);
                ev.weapon            = EventParser::normalizeWeapon(group(m, 8));
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> playerConnect(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex joinRe(R"(^LogNet: Join succeeded: (.+)$)");
                static const std::regex eosRe(
                    R"(^LogEOSAntiCheat: Display: ServerRegisterClient: Client: \((\d+)\) Result: \(EOS_Success\))");

                SvMatch m;
                Core::PlayerConnect ev;
                if (matchBody(body, joinRe, m))
                {
                    ev.name = group(m, 1);
                    if (ev.name.empty())
                    {
                        return std::nullopt;
                    }
                }
                else if (searchBody(body, eosRe, m))
                {
                    ev.inGameId = group(m, 1);
                }
                else
                {
                    return std::nullopt;
                }
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> playerDisconnect(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex eosRe(
                    R"(^LogEOSAntiCheat: Display: ServerUnregisterClient: UserId \((\d+)\), Result: \(EOS_Success\))");
                static const std::regex netRe(R"(^LogNet: Player disconnected: (.+)$)");

                SvMatch m;
                Core::PlayerDisconnect ev;
                if (searchBody(body, eosRe, m))
                {
                    ev.inGameId = group(m, 1);
                }
                else if (matchBody(body, netRe, m))
                {
                    ev.name = group(m, 1);
                    if (ev.name.empty())
                    {
                        return std::nullopt;
                    }
                }
                else
                {
                    return std::nullopt;
                }
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> chatMessage(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogChat: Display: ([^(]+)\((\d+)\) (Global|Team) Chat: (.*)$)");

                SvMatch m;
                if (!matchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::ChatMessage ev;
                ev.sender.name     = group(m, 1);
                ev.sender.inGameId = group(m, 2);
                ev.channel         = group(m, 3) == "Team" ? Core::ChatChannel::Team
                                                           : Core::ChatChannel::Global;
                ev.text            = group(m, 4);
                ev.isCommand       = Utils::startsWith(ev.text, "!");
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> roundStart(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^LogGameplayEvents: Display: (Pre-)?[Rr]ound (\d+) started)");

                SvMatch m;
                if (!searchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::RoundStart ev;
                ev.preRound = m[1].matched;
                ev.round    = groupInt(m, 2, 0);
                return Core::Event(ts, ev);
            }

            std::optional<Core::Event> roundEnd(Utils::TimePoint ts, std::string_view body)
            {
                static const std::regex re(
                    R"(^Log(?:GameMode|GameplayEvents): Display: Round (?:(\d+) )?O\s*ver: Team (\d+) won \(win reason: (.+)\))");

                SvMatch m;
                if (!searchBody(body, re, m))
                {
                    return std::nullopt;
                }

                Core::RoundEnd ev;
                if (m[1].matched)
                {
                    ev.round = groupInt(m, 1, 0);
                }
                ev.winningTeam = groupInt(m, 2);
                ev.reason      = group(m, 3);
                return Core::Event(ts, std::move(ev));
            }

            std::optional<Core::Event> gameOver(Utils::TimePoint ts, std::string_view body)
            {
                if (!Utils::startsWith(body, "LogSession: Display: AINSGameSession::HandleMatchHasEnded"))
                {
                    return std::nullopt;
                }
                return Core::Event(ts, Core::GameOver{});
            }
        } // namespace Matchers

        // ------------------------------------------------------------
        // EventParser
        // ------------------------------------------------------------

        EventParser::EventParser()
        {
            // Objective lines also contain "by <players>" and kill-like
            // brackets, so they are tried before the kill matcher.
            m_matchers = {
                {"map_change",          &Matchers::mapChange},
                {"objective_destroyed", &Matchers::objectiveDestroyed},
                {"objective_captured",  &Matchers::objectiveCaptured},
                {"kill",                &Matchers::kill},
                {"damage",              &Matchers::damage},
                {"player_connect",      &Matchers::playerConnect},
                {"player_disconnect",   &Matchers::playerDisconnect},
                {"chat_message",        &Matchers::chatMessage},
                {"round_start",         &Matchers::roundStart},
                {"round_end",           &Matchers::roundEnd},
                {"game_over",           &Matchers::gameOver},
            };
        }

        void EventParser::addMatcher(std::string name, Matcher matcher)
        {
            m_matchers.emplace_back(std::move(name), std::move(matcher));
        }

        std::optional<EventParser::Prefix> EventParser::splitPrefix(std::string_view line)
        {
            // [2025.10.04-21.27.51:780][866]LogNet: ...
            if (line.empty() || line.front() != '[')
            {
                return std::nullopt;
            }

            const auto tsEnd = line.find(']');
            if (tsEnd == std::string_view::npos)
            {
                return std::nullopt;
            }

            const auto ts = Utils::parseGameTimestamp(line.substr(1, tsEnd - 1));
            if (!ts)
            {
                return std::nullopt;
            }

            std::string_view rest = line.substr(tsEnd + 1);
            if (rest.empty() || rest.front() != '[')
            {
                return std::nullopt;
            }
            const auto frameEnd = rest.find(']');
            if (frameEnd == std::string_view::npos)
            {
                return std::nullopt;
            }
            if (!Utils::parseInteger<long long>(rest.substr(1, frameEnd - 1)))
            {
                return std::nullopt;
            }

            Prefix out;
            out.timestamp = *ts;
            out.body      = rest.substr(frameEnd + 1);
            return out;
        }

        Core::Event EventParser::parseText(std::string_view text) const
        {
            const auto prefix = splitPrefix(text);
            if (!prefix)
            {
                return Core::Event(Utils::TimePoint{}, Core::UnrecognizedLine{});
            }

            for (const auto &[name, matcher] : m_matchers)
            {
                (void)name;
                if (auto ev = matcher(prefix->timestamp, prefix->body))
                {
                    return std::move(*ev);
                }
            }

            return Core::Event(prefix->timestamp, Core::UnrecognizedLine{});
        }

        Core::Event EventParser::parse(const Core::RawLine &line) const
        {
            Core::Event ev = parseText(line.text);
            ev.setServerId(line.serverId);

            Core::LineRef source;
            source.fileIdentity = line.fileIdentity;
            source.startOffset  = line.startOffset;
            source.endOffset    = line.endOffset;
            source.checksum     = line.checksum;
            ev.setSource(std::move(source));
            return ev;
        }

        std::string EventParser::normalizeWeapon(std::string_view raw)
        {
            std::string weapon(Utils::trim(raw));

            if (Utils::startsWith(weapon, "BP_"))
            {
                weapon.erase(0, 3);
            }

            // Instance id suffix: "_2147480339"
            const auto lastUnderscore = weapon.rfind('_');
            if (lastUnderscore != std::string::npos && lastUnderscore + 1 < weapon.size())
            {
                const bool numeric = std::all_of(weapon.begin() + static_cast<std::ptrdiff_t>(lastUnderscore) + 1,
                                                 weapon.end(),
                                                 [](unsigned char c) { return std::isdigit(c) != 0; });
                if (numeric)
                {
                    weapon.resize(lastUnderscore);
                }
            }

            if (Utils::endsWith(weapon, "_C"))
            {
                weapon.resize(weapon.size() - 2);
            }

            for (std::string_view prefix : {"Firearm_", "Weapon_", "Melee_", "Projectile_"})
            {
                if (Utils::startsWith(weapon, prefix))
                {
                    weapon.erase(0, prefix.size());
                }
            }

            std::replace(weapon.begin(), weapon.end(), '_', ' ');

            // "ODCheckpoint A" / "ODCheckpoint B" are the same environmental killer.
            if (Utils::startsWith(weapon, "ODCheckpoint "))
            {
                weapon = "ODCheckpoint";
            }

            return weapon;
        }

        std::vector<Core::PlayerRef> EventParser::parsePlayerList(std::string_view text)
        {
            static const std::regex fullRe(R"(^(.+?)\[([^,\]]*), team (\d+)\]$)");
            static const std::regex simpleRe(R"(^(.+?)\[([^\]]+)\]$)");

            std::vector<Core::PlayerRef> players;
            if (Utils::trim(text) == "?")
            {
                return players;
            }

            for (std::string_view part : Utils::split(text, " + "))
            {
                part = Utils::trim(part);
                if (part.empty() || part == "?")
                {
                    continue;
                }

                SvMatch m;
                Core::PlayerRef ref;
                if (matchBody(part, fullRe, m))
                {
                    ref.name     = group(m, 1);
                    ref.inGameId = group(m, 2);
                    ref.team     = groupInt(m, 3);
                }
                else if (matchBody(part, simpleRe, m))
                {
                    ref.name     = group(m, 1);
                    ref.inGameId = group(m, 2);
                }
                else
                {
                    continue;
                }
                players.push_back(std::move(ref));
            }

            return players;
        }

    } // namespace Input
} // namespace StatTrack
