#include "input/CursorStore.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace StatTrack
{
    namespace Input
    {
        namespace
        {
            // Server names come from configuration; keep file names portable.
            std::string sanitizeFileName(const std::string &name)
            {
                std::string out;
                out.reserve(name.size());
                for (unsigned char ch : name)
                {
                    if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.')
                        out.push_back(static_cast<char>(ch));
                    else
                        out.push_back('_');
                }
                if (out.empty() || out == "." || out == "..")
                {
                    out = "_" + out;
                }
                return out;
            }

            std::string toHex(std::uint64_t value)
            {
                std::ostringstream oss;
                oss << std::hex << std::setw(16) << std::setfill('0') << value;
                return oss.str();
            }

            std::optional<std::uint64_t> fromHex(const std::string &text)
            {
                const std::string_view sv = Utils::trim(text);
                if (sv.empty() || sv.size() > 16)
                {
                    return std::nullopt;
                }
                std::uint64_t value = 0;
                for (char c : sv)
                {
                    value <<= 4;
                    if (c >= '0' && c <= '9')
                        value |= static_cast<std::uint64_t>(c - '0');
                    else if (c >= 'a' && c <= 'f')
                        value |= static_cast<std::uint64_t>(c - 'a' + 10);
                    else if (c >= 'A' && c <= 'F')
                        value |= static_cast<std::uint64_t>(c - 'A' + 10);
                    else
                        return std::nullopt;
                }
                return value;
            }
        } // namespace

        CursorStore::CursorStore(std::string stateDir)
            : m_stateDir(std::move(stateDir))
        {
            if (m_stateDir.empty())
            {
                m_stateDir = ".";
            }
        }

        std::string CursorStore::pathFor(const std::string &serverId) const
        {
            return (std::filesystem::path(m_stateDir) /
                    (sanitizeFileName(serverId) + ".cursor")).string();
        }

        std::optional<Core::LogCursor> CursorStore::load(const std::string &serverId) const
        {
            const std::string path = pathFor(serverId);

            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                return std::nullopt;
            }

            Utils::ConfigLoader values;
            if (!values.loadFromFile(path))
            {
                Utils::getLogger().warn("Cannot read cursor file " + path);
                return std::nullopt;
            }

            const auto offset   = values.getInt("byte_offset");
            const auto length   = values.getInt("last_line_length");
            const auto checksum = fromHex(values.getStringOr("last_line_checksum", ""));
            if (!offset || *offset < 0 || !length || *length < 0 || !checksum)
            {
                Utils::getLogger().warn("Ignoring malformed cursor file " + path);
                return std::nullopt;
            }

            Core::LogCursor cursor;
            cursor.serverId         = values.getStringOr("server_id", serverId);
            cursor.path             = values.getStringOr("path", "");
            cursor.fileIdentity     = values.getStringOr("file_identity", "");
            cursor.byteOffset       = static_cast<std::uint64_t>(*offset);
            cursor.lastLineLength   = static_cast<std::uint64_t>(*length);
            cursor.lastLineChecksum = *checksum;
            return cursor;
        }

        bool CursorStore::save(const Core::LogCursor &cursor) const
        {
            namespace fs = std::filesystem;

            std::error_code ec;
            fs::create_directories(m_stateDir, ec);
            if (ec)
            {
                Utils::getLogger().error("Cannot create state directory " + m_stateDir +
                                         ": " + ec.message());
                return false;
            }

            const std::string path    = pathFor(cursor.serverId);
            const std::string tmpPath = path + ".tmp";

            {
                std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
                if (!out.is_open())
                {
                    Utils::getLogger().error("Cannot write cursor file " + tmpPath);
                    return false;
                }

                out << "# tail position, rewritten on every flush\n";
                out << "server_id = " << cursor.serverId << '\n';
                out << "path = " << cursor.path << '\n';
                out << "file_identity = " << cursor.fileIdentity << '\n';
                out << "byte_offset = " << cursor.byteOffset << '\n';
                out << "last_line_checksum = " << toHex(cursor.lastLineChecksum) << '\n';
                out << "last_line_length = " << cursor.lastLineLength << '\n';
                out.flush();
                if (!out)
                {
                    Utils::getLogger().error("Short write on cursor file " + tmpPath);
                    return false;
                }
            }

            fs::rename(tmpPath, path, ec);
            if (ec)
            {
                Utils::getLogger().error("Cannot replace cursor file " + path + ": " + ec.message());
                fs::remove(tmpPath, ec);
                return false;
            }
            return true;
        }

        bool CursorStore::remove(const std::string &serverId) const
        {
            std::error_code ec;
            std::filesystem::remove(pathFor(serverId), ec);
            return !ec;
        }

    } // namespace Input
} // namespace StatTrack
