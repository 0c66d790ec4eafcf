#include "input/LogTailer.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace StatTrack
{
    namespace Input
    {
        namespace
        {
            constexpr std::size_t kReadChunk = 64 * 1024;
        }

        const char *toString(TailStatus status) noexcept
        {
            switch (status)
            {
            case TailStatus::Ok:      return "ok";
            case TailStatus::NoData:  return "no-data";
            case TailStatus::Missing: return "missing";
            case TailStatus::IoError: return "io-error";
            }
            return "unknown";
        }

        LogTailer::LogTailer(std::string serverId, std::string path, std::size_t maxBytesPerPoll)
            : m_serverId(std::move(serverId)),
              m_path(std::move(path)),
              m_maxBytesPerPoll(maxBytesPerPoll == 0 ? kReadChunk : maxBytesPerPoll),
              m_buffer(kReadChunk)
        {
            m_cursor.serverId = m_serverId;
            m_cursor.path     = m_path;
        }

        LogTailer::~LogTailer()
        {
            close();
        }

        std::optional<LogTailer::FileStat> LogTailer::statPath(const std::string &path,
                                                               std::string *errOut)
        {
            struct stat st;
            if (::stat(path.c_str(), &st) != 0)
            {
                if (errOut != nullptr && errno != ENOENT && errno != ENOTDIR)
                {
                    *errOut = "stat " + path + ": " + std::strerror(errno);
                }
                return std::nullopt;
            }

            FileStat out;
            out.identity = std::to_string(static_cast<unsigned long long>(st.st_dev)) + ":" +
                           std::to_string(static_cast<unsigned long long>(st.st_ino));
            out.size     = static_cast<std::uint64_t>(st.st_size);
            return out;
        }

        std::string LogTailer::baseIdentity(const std::string &fileIdentity)
        {
            const auto pos = fileIdentity.find('#');
            return pos == std::string::npos ? fileIdentity : fileIdentity.substr(0, pos);
        }

        std::string LogTailer::nextGeneration(const std::string &fileIdentity)
        {
            const auto pos = fileIdentity.find('#');
            if (pos == std::string::npos)
            {
                return fileIdentity + "#1";
            }
            const auto gen = Utils::parseInteger<unsigned long long>(
                std::string_view(fileIdentity).substr(pos + 1));
            return fileIdentity.substr(0, pos) + "#" + std::to_string(gen ? *gen + 1 : 1);
        }

        bool LogTailer::open(const std::optional<Core::LogCursor> &cursor)
        {
            close();

            m_cursor          = Core::LogCursor{};
            m_cursor.serverId = m_serverId;
            m_cursor.path     = m_path;
            if (cursor && !cursor->isFresh())
            {
                m_cursor.fileIdentity     = cursor->fileIdentity;
                m_cursor.byteOffset       = cursor->byteOffset;
                m_cursor.lastLineChecksum = cursor->lastLineChecksum;
                m_cursor.lastLineLength   = cursor->lastLineLength;
            }

            TailResult scratch;
            const OpenOutcome outcome = openFile(scratch);
            if (outcome == OpenOutcome::Failed)
            {
                Utils::getLogger().error("[" + m_serverId + "] " + scratch.error);
            }
            return outcome == OpenOutcome::Opened;
        }

        void LogTailer::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_openBase.clear();
            m_pending.clear();
            m_readOffset = m_cursor.byteOffset;
        }

        bool LogTailer::isOpen() const noexcept
        {
            return m_stream.is_open();
        }

        bool LogTailer::verifyLastLine(const Core::LogCursor &cursor) const
        {
            if (cursor.lastLineLength == 0)
            {
                // Nothing recorded to compare against; size check only.
                return true;
            }
            if (cursor.lastLineLength > cursor.byteOffset)
            {
                return false;
            }

            std::ifstream in(m_path, std::ios::in | std::ios::binary);
            if (!in.is_open())
            {
                return false;
            }

            std::string bytes(static_cast<std::size_t>(cursor.lastLineLength), '\0');
            in.seekg(static_cast<std::streamoff>(cursor.byteOffset - cursor.lastLineLength));
            in.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (static_cast<std::uint64_t>(in.gcount()) != cursor.lastLineLength)
            {
                return false;
            }
            return Utils::fnv1a64(bytes) == cursor.lastLineChecksum;
        }

        LogTailer::OpenOutcome LogTailer::openFile(TailResult &result)
        {
            std::string err;
            const auto st = statPath(m_path, &err);
            if (!st)
            {
                if (!err.empty())
                {
                    result.error = err;
                    return OpenOutcome::Failed;
                }
                return OpenOutcome::Missing;
            }

            auto &log = Utils::getLogger();
            const Core::LogCursor previous = m_cursor;

            std::string   identity = st->identity;
            std::uint64_t offset   = 0;

            if (!previous.isFresh() && baseIdentity(previous.fileIdentity) == st->identity)
            {
                if (st->size >= previous.byteOffset && verifyLastLine(previous))
                {
                    identity = previous.fileIdentity;
                    offset   = previous.byteOffset;
                }
                else
                {
                    identity = nextGeneration(previous.fileIdentity);
                    result.rotated = true;
                    ++m_rotations;
                    log.info("[" + m_serverId + "] " + m_path +
                             " was truncated, restarting at offset 0 as " + identity);
                }
            }
            else if (!previous.isFresh())
            {
                result.rotated = true;
                ++m_rotations;
                log.info("[" + m_serverId + "] " + m_path + " is a new file (" +
                         previous.fileIdentity + " -> " + identity + "), reading from offset 0");
            }

            m_stream.open(m_path, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                result.error = "cannot open " + m_path + ": " + std::strerror(errno);
                return OpenOutcome::Failed;
            }

            m_stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
            if (!m_stream)
            {
                m_stream.close();
                result.error = "cannot seek " + m_path + " to " + std::to_string(offset);
                return OpenOutcome::Failed;
            }

            m_openBase            = st->identity;
            m_pending.clear();
            m_readOffset          = offset;
            m_cursor.fileIdentity = identity;
            m_cursor.byteOffset   = offset;
            if (identity != previous.fileIdentity || offset == 0)
            {
                m_cursor.lastLineChecksum = 0;
                m_cursor.lastLineLength   = 0;
            }

            log.debug("[" + m_serverId + "] tailing " + m_path + " (" + identity +
                      ") from offset " + std::to_string(offset));
            return OpenOutcome::Opened;
        }

        void LogTailer::readAvailable(TailResult &result, bool unbounded)
        {
            m_stream.clear();
            m_stream.seekg(static_cast<std::streamoff>(m_readOffset), std::ios::beg);

            std::size_t total = 0;
            while (unbounded || total < m_maxBytesPerPoll)
            {
                const std::size_t want = unbounded
                    ? m_buffer.size()
                    : std::min(m_buffer.size(), m_maxBytesPerPoll - total);
                m_stream.read(m_buffer.data(), static_cast<std::streamsize>(want));
                const std::streamsize n = m_stream.gcount();
                if (n > 0)
                {
                    m_pending.append(m_buffer.data(), static_cast<std::size_t>(n));
                    m_readOffset += static_cast<std::uint64_t>(n);
                    total        += static_cast<std::size_t>(n);
                }
                if (!m_stream)
                {
                    if (m_stream.bad())
                    {
                        result.error = "read error on " + m_path;
                    }
                    break;
                }
            }
            m_stream.clear();

            emitCompleteLines(result);
        }

        void LogTailer::emitCompleteLines(TailResult &result)
        {
            std::size_t pos = 0;
            while (true)
            {
                const std::size_t nl = m_pending.find('\n', pos);
                if (nl == std::string::npos)
                {
                    break;
                }

                const std::string_view raw(m_pending.data() + pos, nl + 1 - pos);

                Core::RawLine line;
                line.serverId     = m_serverId;
                line.fileIdentity = m_cursor.fileIdentity;
                line.startOffset  = m_cursor.byteOffset;
                line.endOffset    = m_cursor.byteOffset + raw.size();
                line.checksum     = Utils::fnv1a64(raw);

                std::string_view text = raw.substr(0, raw.size() - 1);
                if (!text.empty() && text.back() == '\r')
                {
                    text.remove_suffix(1);
                }
                line.text.assign(text.data(), text.size());

                m_cursor.byteOffset       = line.endOffset;
                m_cursor.lastLineChecksum = line.checksum;
                m_cursor.lastLineLength   = raw.size();

                result.lines.push_back(std::move(line));
                pos = nl + 1;
            }
            m_pending.erase(0, pos);
        }

        void LogTailer::emitPartialLine(TailResult &result)
        {
            if (m_pending.empty())
            {
                return;
            }

            // The file will not grow any more: its last line has no terminator.
            Core::RawLine line;
            line.serverId     = m_serverId;
            line.fileIdentity = m_cursor.fileIdentity;
            line.startOffset  = m_cursor.byteOffset;
            line.endOffset    = m_cursor.byteOffset + m_pending.size();
            line.checksum     = Utils::fnv1a64(m_pending);
            line.text         = m_pending;
            if (!line.text.empty() && line.text.back() == '\r')
            {
                line.text.pop_back();
            }

            m_cursor.byteOffset       = line.endOffset;
            m_cursor.lastLineChecksum = line.checksum;
            m_cursor.lastLineLength   = m_pending.size();
            m_pending.clear();

            result.lines.push_back(std::move(line));
        }

        void LogTailer::finish(TailResult &result, TailStatus emptyStatus) const
        {
            if (!result.error.empty())
            {
                result.status = TailStatus::IoError;
            }
            else if (!result.lines.empty())
            {
                result.status = TailStatus::Ok;
            }
            else
            {
                result.status = emptyStatus;
            }
        }

        TailResult LogTailer::poll()
        {
            TailResult result;

            if (!m_stream.is_open())
            {
                const OpenOutcome outcome = openFile(result);
                if (outcome == OpenOutcome::Missing)
                {
                    result.status = TailStatus::Missing;
                    return result;
                }
                if (outcome == OpenOutcome::Failed)
                {
                    result.status = TailStatus::IoError;
                    return result;
                }
            }

            std::string err;
            const auto st = statPath(m_path, &err);
            if (!st)
            {
                // Renamed away or deleted: the open stream may still hold
                // lines the server wrote before it let go of the file.
                readAvailable(result, false);
                if (!err.empty() && result.error.empty())
                {
                    result.error = err;
                }
                finish(result, TailStatus::Missing);
                return result;
            }

            if (st->identity != m_openBase)
            {
                readAvailable(result, true);
                emitPartialLine(result);
                m_stream.close();
                m_openBase.clear();

                if (openFile(result) != OpenOutcome::Opened)
                {
                    finish(result, TailStatus::Missing);
                    return result;
                }
                readAvailable(result, false);
                finish(result, TailStatus::NoData);
                return result;
            }

            // Shrunk below what we read, or refilled past it with other content.
            if (st->size < m_readOffset ||
                (st->size > m_readOffset && !verifyLastLine(m_cursor)))
            {
                m_stream.close();
                m_openBase.clear();
                m_pending.clear();
                m_readOffset = m_cursor.byteOffset;

                if (openFile(result) != OpenOutcome::Opened)
                {
                    finish(result, TailStatus::Missing);
                    return result;
                }
            }

            readAvailable(result, false);
            finish(result, TailStatus::NoData);
            return result;
        }

    } // namespace Input
} // namespace StatTrack
