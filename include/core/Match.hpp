#ifndef CORE_MATCH_HPP
#define CORE_MATCH_HPP

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "utils/TimeUtils.hpp"

namespace StatTrack
{
namespace Core
{

/**
 * @brief Lifecycle state of one match.
 *
 * Idle is a tracker phase (no open match); it never appears on a
 * MatchRecord but is part of the same enum so the tracker can report
 * a single phase value.
 */
enum class MatchState : std::uint8_t
{
    Idle = 0,
    Warmup,
    RoundActive,
    RoundEnd,
    Concluded,
};

inline const char *toString(MatchState state) noexcept
{
    switch (state)
    {
    case MatchState::Idle:        return "Idle";
    case MatchState::Warmup:      return "Warmup";
    case MatchState::RoundActive: return "RoundActive";
    case MatchState::RoundEnd:    return "RoundEnd";
    case MatchState::Concluded:   return "Concluded";
    }
    return "Unknown";
}

inline std::optional<MatchState> parseMatchState(std::string_view text) noexcept
{
    for (MatchState state : {MatchState::Idle, MatchState::Warmup, MatchState::RoundActive,
                             MatchState::RoundEnd, MatchState::Concluded})
    {
        if (text == toString(state))
        {
            return state;
        }
    }
    return std::nullopt;
}

/**
 * @brief One played match on one server.
 *
 * Responsibilities:
 *  - Carry what the stats store needs to open and close a match.
 *  - Track round progress for the tracker.
 *
 * Invariant: at most one open round at a time (state == RoundActive).
 */
struct MatchRecord
{
    std::string                  matchId;     ///< "<serverId>:<startMillis>".
    std::string                  serverId;
    std::string                  mapName;
    std::string                  scenario;
    std::string                  lighting;
    Utils::TimePoint             startedAt{};
    std::optional<Utils::TimePoint> endedAt;
    MatchState                   state = MatchState::Warmup;
    int                          roundNumber = 0;   ///< Rounds started so far.
    int                          roundsPlayed = 0;  ///< Rounds that reached RoundEnd.
    int                          winningTeam = -1;  ///< Winner of the last finished round.
    bool                         gameOver = false;  ///< GameOver seen; closes on next MapChange.

    bool isOpen() const noexcept { return state != MatchState::Concluded; }
};

/// Build the match id from its server and in-game start time.
inline std::string makeMatchId(const std::string &serverId, Utils::TimePoint startedAt)
{
    return serverId + ":" + std::to_string(Utils::toMillisSinceEpoch(startedAt));
}

/**
 * @brief Canonical player identity produced by the resolver.
 *
 * key never changes once assigned: "id:<inGameId>" when the first sighting
 * carried an id, otherwise "name:<displayName>".
 */
struct PlayerIdentity
{
    std::string      key;
    std::string      displayName;
    std::string      inGameId;
    Utils::TimePoint lastSeen{};
};

/**
 * @brief A player's presence within one match.
 */
struct PlayerSession
{
    std::string                     serverId;
    std::string                     matchId;
    std::string                     identity;   ///< PlayerIdentity::key.
    std::string                     displayName;
    Utils::TimePoint                joinedAt{};
    std::optional<Utils::TimePoint> leftAt;
    int                             team = -1;
    int                             snapshotMisses = 0;

    bool isOpen() const noexcept { return !leftAt.has_value(); }
};

} // namespace Core
} // namespace StatTrack

#endif // CORE_MATCH_HPP
