#ifndef CORE_LOG_CURSOR_HPP
#define CORE_LOG_CURSOR_HPP

#include <cstdint>
#include <string>

namespace StatTrack
{
namespace Core
{

/**
 * @brief Durable tailing progress for one watched file.
 *
 * Invariant: for a given fileIdentity, byteOffset never decreases. A new
 * identity (rotation, recreation, truncation) restarts the offset at 0.
 *
 * The checksum/length pair describes the last consumed line (the bytes
 * immediately before byteOffset, terminator included) so a resumed tailer
 * can prove it is looking at the same content and not at a file that was
 * truncated and refilled past the old offset.
 */
struct LogCursor
{
    std::string   serverId;
    std::string   path;
    std::string   fileIdentity;           ///< "<device>:<inode>", empty if never opened.
    std::uint64_t byteOffset = 0;
    std::uint64_t lastLineChecksum = 0;   ///< FNV-1a of the last consumed line.
    std::uint64_t lastLineLength = 0;     ///< Bytes covered by lastLineChecksum.

    bool isFresh() const noexcept
    {
        return fileIdentity.empty();
    }
};

/**
 * @brief One physical line read from a log file.
 *
 * [startOffset, endOffset) covers the line including its terminator.
 * Ephemeral: consumed immediately by the parser.
 */
struct RawLine
{
    std::string   serverId;
    std::string   fileIdentity;
    std::uint64_t startOffset = 0;
    std::uint64_t endOffset = 0;
    std::uint64_t checksum = 0;  ///< FNV-1a over the raw bytes incl. terminator.
    std::string   text;          ///< Without '\n' / '\r\n'.
};

/**
 * @brief Idempotency key for everything derived from one log line.
 *
 * Format: "<fileIdentity>@<startOffset>". Replaying the same line after a
 * crash yields the same key, so re-application is a no-op downstream.
 */
inline std::string lineKey(const std::string &fileIdentity, std::uint64_t startOffset)
{
    return fileIdentity + "@" + std::to_string(startOffset);
}

} // namespace Core
} // namespace StatTrack

#endif // CORE_LOG_CURSOR_HPP
