#ifndef CORE_EVENT_HPP
#define CORE_EVENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "utils/TimeUtils.hpp"

namespace StatTrack
{
namespace Core
{

/**
 * @brief Kinds of typed occurrences recognized in a server log.
 *
 * The order matches the alternatives of Event::Payload.
 */
enum class EventKind : std::uint8_t
{
    Unrecognized = 0,
    PlayerConnect,
    PlayerDisconnect,
    Kill,
    Damage,
    ChatMessage,
    RoundStart,
    RoundEnd,
    MapChange,
    GameOver,
    ObjectiveCaptured,
    ObjectiveDestroyed,
};

inline const char *toString(EventKind kind) noexcept
{
    switch (kind)
    {
    case EventKind::Unrecognized:       return "Unrecognized";
    case EventKind::PlayerConnect:      return "PlayerConnect";
    case EventKind::PlayerDisconnect:   return "PlayerDisconnect";
    case EventKind::Kill:               return "Kill";
    case EventKind::Damage:             return "Damage";
    case EventKind::ChatMessage:        return "ChatMessage";
    case EventKind::RoundStart:         return "RoundStart";
    case EventKind::RoundEnd:           return "RoundEnd";
    case EventKind::MapChange:          return "MapChange";
    case EventKind::GameOver:           return "GameOver";
    case EventKind::ObjectiveCaptured:  return "ObjectiveCaptured";
    case EventKind::ObjectiveDestroyed: return "ObjectiveDestroyed";
    }
    return "Unknown";
}

/// In-game id the log uses for AI-controlled players.
inline constexpr const char *kBotId = "INVALID";

/**
 * @brief A player as referenced by one log line: "Name[id, team N]".
 */
struct PlayerRef
{
    std::string name;
    std::string inGameId;  ///< Empty when the line does not carry one.
    int         team = -1; ///< -1 when unknown.

    bool isBot() const noexcept { return inGameId == kBotId; }
    bool hasId() const noexcept { return !inGameId.empty() && !isBot(); }
};

struct UnrecognizedLine
{
};

/// "Join succeeded: Name" carries only the name, the anti-cheat
/// registration line only the id.
struct PlayerConnect
{
    std::string name;
    std::string inGameId;
};

struct PlayerDisconnect
{
    std::string name;
    std::string inGameId;
};

struct Kill
{
    std::optional<PlayerRef> killer;    ///< Empty for "?" (world / no player).
    std::vector<PlayerRef>   assisters; ///< Everyone after the first " + ".
    PlayerRef                victim;
    std::string              weapon;    ///< Normalized weapon identifier.
    bool                     headshot = false;
};

struct Damage
{
    PlayerRef     attacker;
    PlayerRef     victim;
    std::int64_t  amount = 0;
    std::string   weapon;
};

enum class ChatChannel : std::uint8_t
{
    Global,
    Team,
};

struct ChatMessage
{
    PlayerRef   sender;
    ChatChannel channel = ChatChannel::Global;
    std::string text;
    bool        isCommand = false;  ///< Text starts with '!'.
};

struct RoundStart
{
    int  round = 0;
    bool preRound = false;
};

struct RoundEnd
{
    std::optional<int> round;
    int                winningTeam = -1;
    std::string        reason;
};

struct MapChange
{
    std::string mapName;
    std::string scenario;
    std::string lighting;
    int         maxPlayers = 0;
};

struct GameOver
{
};

struct ObjectiveCaptured
{
    int                    objective = 0;
    int                    capturingTeam = -1;
    int                    losingTeam = -1;
    std::vector<PlayerRef> players;
};

struct ObjectiveDestroyed
{
    int                    objective = 0;
    int                    owningTeam = -1;
    int                    destroyingTeam = -1;
    std::vector<PlayerRef> players;
};

/**
 * @brief Where in the source file an event came from.
 *
 * Used both for idempotency keys and for cursor acknowledgements.
 */
struct LineRef
{
    std::string   fileIdentity;
    std::uint64_t startOffset = 0;
    std::uint64_t endOffset = 0;
    std::uint64_t checksum = 0;
};

/**
 * @brief A typed, parsed occurrence from one log line.
 *
 * Tagged variant: kind() always agrees with the active payload alternative.
 * Created by the parser, consumed by the match tracker, never persisted.
 */
class Event
{
public:
    using Payload = std::variant<UnrecognizedLine,
                                 PlayerConnect,
                                 PlayerDisconnect,
                                 Kill,
                                 Damage,
                                 ChatMessage,
                                 RoundStart,
                                 RoundEnd,
                                 MapChange,
                                 GameOver,
                                 ObjectiveCaptured,
                                 ObjectiveDestroyed>;

    Event() = default;

    template <typename T>
    Event(Utils::TimePoint timestamp, T payload)
        : m_timestamp(timestamp),
          m_payload(std::move(payload))
    {
    }

    EventKind kind() const noexcept
    {
        return static_cast<EventKind>(m_payload.index());
    }

    const Utils::TimePoint &timestamp() const noexcept { return m_timestamp; }

    const std::string &serverId() const noexcept { return m_serverId; }
    void setServerId(std::string serverId) { m_serverId = std::move(serverId); }

    const LineRef &source() const noexcept { return m_source; }
    void setSource(LineRef source) { m_source = std::move(source); }

    const Payload &payload() const noexcept { return m_payload; }

    template <typename T>
    const T *as() const noexcept
    {
        return std::get_if<T>(&m_payload);
    }

private:
    Utils::TimePoint m_timestamp{};
    std::string      m_serverId;
    LineRef          m_source;
    Payload          m_payload;
};

} // namespace Core
} // namespace StatTrack

#endif // CORE_EVENT_HPP
