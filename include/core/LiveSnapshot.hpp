#ifndef CORE_LIVE_SNAPSHOT_HPP
#define CORE_LIVE_SNAPSHOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils/TimeUtils.hpp"

namespace StatTrack
{
namespace Core
{

/**
 * @brief One row of an A2S player response.
 *
 * The protocol exposes no stable id, only the display name.
 */
struct SnapshotPlayer
{
    std::uint8_t index = 0;
    std::string  name;
    std::int32_t score = 0;
    float        durationSecs = 0.0f;  ///< Time connected, as reported by the server.
};

/**
 * @brief Decoded A2S info response.
 *
 * Optional members are only present when the server sets the
 * corresponding extra data flag.
 */
struct ServerInfo
{
    std::uint8_t  protocol = 0;
    std::string   name;
    std::string   map;
    std::string   folder;
    std::string   game;
    std::uint16_t appId = 0;
    std::uint8_t  players = 0;
    std::uint8_t  maxPlayers = 0;
    std::uint8_t  bots = 0;
    char          serverType = '\0';   ///< 'd' dedicated, 'l' listen, 'p' proxy.
    char          environment = '\0';  ///< 'l' linux, 'w' windows, 'm'/'o' mac.
    bool          passwordProtected = false;
    bool          vacSecured = false;
    std::string   version;

    std::optional<std::uint16_t> gamePort;
    std::optional<std::uint64_t> steamId;
    std::optional<std::uint16_t> sourceTvPort;
    std::optional<std::string>   sourceTvName;
    std::optional<std::string>   keywords;
    std::optional<std::uint64_t> gameId;
};

/**
 * @brief One point-in-time query result for a server.
 *
 * reachable == false means the query failed for this cycle; such a
 * snapshot carries no players and must not be read as "everybody left".
 */
struct LiveSnapshot
{
    std::string                 serverId;
    Utils::TimePoint            queriedAt{};
    bool                        reachable = false;
    std::optional<ServerInfo>   info;
    std::vector<SnapshotPlayer> players;
    std::string                 error;  ///< Last failure reason when unreachable.
};

} // namespace Core
} // namespace StatTrack

#endif // CORE_LIVE_SNAPSHOT_HPP
