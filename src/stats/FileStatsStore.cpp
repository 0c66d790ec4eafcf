#include "stats/FileStatsStore.hpp"

#include <filesystem>
#include <iterator>
#include <sstream>
#include <system_error>
#include <vector>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace StatTrack
{
    namespace Stats
    {
        namespace
        {
            constexpr std::size_t kMatchFields = 12;
            constexpr std::size_t kDeltaFields = 9;
            constexpr std::size_t kSessionFields = 8;

            std::string field(std::string_view raw)
            {
                return Utils::unescapeField(raw);
            }

            template <typename IntType>
            bool intField(std::string_view raw, IntType &out)
            {
                const auto value = Utils::parseInteger<IntType>(field(raw));
                if (!value)
                {
                    return false;
                }
                out = *value;
                return true;
            }

            bool decodeMatch(const std::vector<std::string_view> &f, Core::MatchRecord &match)
            {
                if (f.size() != kMatchFields)
                {
                    return false;
                }

                long long startMs = 0;
                if (!intField(f[6], startMs) || !intField(f[8], match.roundNumber) ||
                    !intField(f[9], match.roundsPlayed) || !intField(f[10], match.winningTeam))
                {
                    return false;
                }

                match.matchId   = field(f[1]);
                match.serverId  = field(f[2]);
                match.mapName   = field(f[3]);
                match.scenario  = field(f[4]);
                match.lighting  = field(f[5]);
                match.startedAt = Utils::fromMillisSinceEpoch(startMs);

                const std::string end = field(f[7]);
                if (!end.empty())
                {
                    long long endMs = 0;
                    if (!intField(f[7], endMs))
                    {
                        return false;
                    }
                    match.endedAt = Utils::fromMillisSinceEpoch(endMs);
                }
                match.gameOver = field(f[11]) == "1";
                return !match.matchId.empty();
            }

            bool decodeProgress(const std::vector<std::string_view> &f, Core::MatchRecord &match)
            {
                if (f.size() != kMatchFields + 1)
                {
                    return false;
                }
                const auto state = Core::parseMatchState(field(f[kMatchFields]));
                const std::vector<std::string_view> head(f.begin(), f.begin() + kMatchFields);
                if (!state || !decodeMatch(head, match))
                {
                    return false;
                }
                match.state = *state;
                return true;
            }

            bool decodeSession(const std::vector<std::string_view> &f, Core::PlayerSession &session)
            {
                if (f.size() != kSessionFields)
                {
                    return false;
                }

                long long joinedMs = 0;
                if (!intField(f[5], joinedMs) || !intField(f[7], session.team))
                {
                    return false;
                }

                session.matchId     = field(f[1]);
                session.serverId    = field(f[2]);
                session.identity    = field(f[3]);
                session.displayName = field(f[4]);
                session.joinedAt    = Utils::fromMillisSinceEpoch(joinedMs);

                if (!field(f[6]).empty())
                {
                    long long leftMs = 0;
                    if (!intField(f[6], leftMs))
                    {
                        return false;
                    }
                    session.leftAt = Utils::fromMillisSinceEpoch(leftMs);
                }
                return !session.matchId.empty() && !session.identity.empty();
            }

            bool decodeDelta(const std::vector<std::string_view> &f, Core::StatDelta &delta)
            {
                if (f.size() != kDeltaFields)
                {
                    return false;
                }

                const auto metric = Core::parseMetric(field(f[5]));
                if (!metric || !intField(f[7], delta.amount))
                {
                    return false;
                }

                delta.idempotencyKey = field(f[1]);
                delta.matchId        = field(f[2]);
                delta.identity       = field(f[3]);
                delta.displayName    = field(f[4]);
                delta.metric         = *metric;
                delta.weapon         = field(f[6]);
                delta.outOfRound     = field(f[8]) == "1";
                return !delta.idempotencyKey.empty() && !delta.identity.empty();
            }
        } // namespace

        FileStatsStore::FileStatsStore(std::string journalPath)
            : m_path(std::move(journalPath))
        {
            namespace fs = std::filesystem;

            const fs::path parent = fs::path(m_path).parent_path();
            if (!parent.empty())
            {
                std::error_code ec;
                fs::create_directories(parent, ec);
                if (ec)
                {
                    throw StoreError("cannot create directory " + parent.string() + ": " + ec.message());
                }
            }

            replay();

            m_out.open(m_path, std::ios::out | std::ios::binary | std::ios::app);
            if (!m_out.is_open())
            {
                throw StoreError("cannot open stats journal " + m_path);
            }

            Utils::getLogger().info("Stats journal " + m_path + ": " + std::to_string(m_replayed) +
                                    " record(s) replayed, " + std::to_string(m_tables.matches().size()) + " match(es)");
        }

        FileStatsStore::~FileStatsStore()
        {
            if (m_out.is_open())
            {
                m_out.flush();
            }
        }

        void FileStatsStore::replay()
        {
            std::ifstream in(m_path, std::ios::in | std::ios::binary);
            if (!in.is_open())
            {
                return;  // first run
            }

            const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            in.close();

            std::size_t start = 0;
            while (start < content.size())
            {
                const std::size_t end = content.find('\n', start);
                if (end == std::string::npos)
                {
                    Utils::getLogger().warn("Dropping torn record at the end of " + m_path);
                    ++m_skipped;

                    std::error_code ec;
                    std::filesystem::resize_file(m_path, start, ec);
                    if (ec)
                    {
                        throw StoreError("cannot truncate torn record in " + m_path + ": " + ec.message());
                    }
                    break;
                }

                std::string_view line(content.data() + start, end - start);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                start = end + 1;

                if (line.empty() || line.front() == '#')
                {
                    continue;
                }
                if (applyRecord(line))
                {
                    ++m_replayed;
                }
                else
                {
                    ++m_skipped;
                    Utils::getLogger().warn("Skipping unreadable stats record in " + m_path + ": " +
                                            std::string(line.substr(0, 80)));
                }
            }
        }

        bool FileStatsStore::applyRecord(std::string_view line)
        {
            const auto fields = Utils::splitRecord(line);
            if (fields.empty() || fields[0].size() != 1)
            {
                return false;
            }

            switch (fields[0][0])
            {
            case 'O':
            case 'C':
            {
                Core::MatchRecord match;
                if (!decodeMatch(fields, match))
                {
                    return false;
                }
                if (fields[0][0] == 'O')
                {
                    m_tables.openMatch(match);
                }
                else
                {
                    m_tables.closeMatch(match);
                }
                return true;
            }
            case 'U':
            {
                Core::MatchRecord match;
                if (!decodeProgress(fields, match))
                {
                    return false;
                }
                m_tables.saveMatchProgress(match);
                return true;
            }
            case 'S':
            case 'E':
            {
                Core::PlayerSession session;
                if (!decodeSession(fields, session))
                {
                    return false;
                }
                if (fields[0][0] == 'S')
                {
                    m_tables.openSession(session);
                }
                else
                {
                    m_tables.closeSession(session);
                }
                return true;
            }
            case 'P':
            case 'A':
            {
                Core::StatDelta delta;
                if (!decodeDelta(fields, delta))
                {
                    return false;
                }
                if (fields[0][0] == 'P')
                {
                    m_tables.upsertPlayerMatchStats(delta);
                }
                else
                {
                    m_tables.upsertAllTimeStats(delta);
                }
                return true;
            }
            default:
                return false;
            }
        }

        std::string FileStatsStore::encodeMatch(char tag, const Core::MatchRecord &match)
        {
            std::ostringstream oss;
            oss << tag << '|' << Utils::escapeField(match.matchId) << '|' << Utils::escapeField(match.serverId)
                << '|' << Utils::escapeField(match.mapName) << '|' << Utils::escapeField(match.scenario)
                << '|' << Utils::escapeField(match.lighting) << '|' << Utils::toMillisSinceEpoch(match.startedAt)
                << '|';
            if (match.endedAt)
            {
                oss << Utils::toMillisSinceEpoch(*match.endedAt);
            }
            oss << '|' << match.roundNumber << '|' << match.roundsPlayed << '|' << match.winningTeam << '|'
                << (match.gameOver ? '1' : '0');
            return oss.str();
        }

        std::string FileStatsStore::encodeDelta(char tag, const Core::StatDelta &delta)
        {
            std::ostringstream oss;
            oss << tag << '|' << Utils::escapeField(delta.idempotencyKey) << '|' << Utils::escapeField(delta.matchId)
                << '|' << Utils::escapeField(delta.identity) << '|' << Utils::escapeField(delta.displayName)
                << '|' << Core::toString(delta.metric) << '|' << Utils::escapeField(delta.weapon) << '|'
                << delta.amount << '|' << (delta.outOfRound ? '1' : '0');
            return oss.str();
        }

        std::string FileStatsStore::encodeSession(char tag, const Core::PlayerSession &session)
        {
            std::ostringstream oss;
            oss << tag << '|' << Utils::escapeField(session.matchId) << '|' << Utils::escapeField(session.serverId)
                << '|' << Utils::escapeField(session.identity) << '|' << Utils::escapeField(session.displayName)
                << '|' << Utils::toMillisSinceEpoch(session.joinedAt) << '|';
            if (session.leftAt)
            {
                oss << Utils::toMillisSinceEpoch(*session.leftAt);
            }
            oss << '|' << session.team;
            return oss.str();
        }

        bool FileStatsStore::append(const std::string &record)
        {
            m_out << record << '\n';
            if (!m_out)
            {
                Utils::getLogger().critical("Cannot append to stats journal " + m_path);
                m_out.clear();
                return false;
            }
            return true;
        }

        UpsertResult FileStatsStore::openMatch(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (!m_tables.wouldOpen(match))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeMatch('O', match)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.openMatch(match);
        }

        UpsertResult FileStatsStore::closeMatch(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (!m_tables.wouldClose(match))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeMatch('C', match)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.closeMatch(match);
        }

        UpsertResult FileStatsStore::saveMatchProgress(const Core::MatchRecord &match)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (!m_tables.wouldSaveProgress(match))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeMatch('U', match) + '|' + Core::toString(match.state)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.saveMatchProgress(match);
        }

        UpsertResult FileStatsStore::openSession(const Core::PlayerSession &session)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (!m_tables.wouldOpenSession(session))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeSession('S', session)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.openSession(session);
        }

        UpsertResult FileStatsStore::closeSession(const Core::PlayerSession &session)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (!m_tables.wouldCloseSession(session))
            {
                return UpsertResult::Duplicate;
            }

            Core::PlayerSession closed = session;
            if (!closed.leftAt)
            {
                closed.leftAt = closed.joinedAt;
            }
            if (!append(encodeSession('E', closed)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.closeSession(closed);
        }

        UpsertResult FileStatsStore::upsertPlayerMatchStats(const Core::StatDelta &delta)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (m_tables.hasPlayerMatchKey(delta.idempotencyKey))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeDelta('P', delta)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.upsertPlayerMatchStats(delta);
        }

        UpsertResult FileStatsStore::upsertAllTimeStats(const Core::StatDelta &delta)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            if (m_tables.hasAllTimeKey(delta.idempotencyKey))
            {
                return UpsertResult::Duplicate;
            }
            if (!append(encodeDelta('A', delta)))
            {
                return UpsertResult::Failed;
            }
            return m_tables.upsertAllTimeStats(delta);
        }

        bool FileStatsStore::flush()
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            m_out.flush();
            if (!m_out)
            {
                Utils::getLogger().critical("Cannot flush stats journal " + m_path);
                m_out.clear();
                return false;
            }
            return true;
        }

        std::optional<Core::MatchRecord> FileStatsStore::match(const std::string &matchId) const
        {
            return m_tables.match(matchId);
        }

        std::vector<Core::MatchRecord> FileStatsStore::matches() const
        {
            return m_tables.matches();
        }

        std::optional<Core::MatchRecord> FileStatsStore::activeMatch(const std::string &serverId) const
        {
            return m_tables.activeMatch(serverId);
        }

        std::vector<Core::PlayerSession> FileStatsStore::sessions(const std::string &matchId) const
        {
            return m_tables.sessions(matchId);
        }

        std::optional<Core::PlayerMatchStats> FileStatsStore::playerMatchStats(const std::string &matchId,
                                                                               const std::string &identity) const
        {
            return m_tables.playerMatchStats(matchId, identity);
        }

        std::vector<Core::PlayerMatchStats> FileStatsStore::matchStats(const std::string &matchId) const
        {
            return m_tables.matchStats(matchId);
        }

        std::optional<Core::PlayerMatchStats> FileStatsStore::allTimeStats(const std::string &identity) const
        {
            return m_tables.allTimeStats(identity);
        }

        std::vector<Core::PlayerMatchStats> FileStatsStore::allTime() const
        {
            return m_tables.allTime();
        }

    } // namespace Stats
} // namespace StatTrack
