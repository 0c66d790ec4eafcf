#ifndef CORE_SERVER_TARGET_HPP
#define CORE_SERVER_TARGET_HPP

#include <optional>
#include <string>

namespace StatTrack
{
namespace Core
{

/**
 * @brief One configured game server.
 *
 * Produced by the surrounding application's configuration layer and
 * treated as immutable for the lifetime of a run. The name doubles as the
 * server id used in match ids, cursors and log messages.
 */
struct ServerTarget
{
    std::string                name;          ///< Server id.
    std::string                logPath;       ///< Server log file to tail.
    bool                       enabled = true;
    std::optional<std::string> queryAddress;  ///< "host:port" for A2S, if any.
};

} // namespace Core
} // namespace StatTrack

#endif // CORE_SERVER_TARGET_HPP
