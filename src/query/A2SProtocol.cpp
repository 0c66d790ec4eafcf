#include "query/A2SProtocol.hpp"

#include <cstring>

namespace StatTrack
{
    namespace Query
    {
        // ------------------------------------------------------------
        // ByteWriter
        // ------------------------------------------------------------

        ByteWriter &ByteWriter::u8(std::uint8_t v)
        {
            m_data.push_back(v);
            return *this;
        }

        ByteWriter &ByteWriter::u16(std::uint16_t v)
        {
            m_data.push_back(static_cast<std::uint8_t>(v & 0xFF));
            m_data.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
            return *this;
        }

        ByteWriter &ByteWriter::u32(std::uint32_t v)
        {
            for (int shift = 0; shift < 32; shift += 8)
            {
                m_data.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
            }
            return *this;
        }

        ByteWriter &ByteWriter::i32(std::int32_t v)
        {
            return u32(static_cast<std::uint32_t>(v));
        }

        ByteWriter &ByteWriter::u64(std::uint64_t v)
        {
            for (int shift = 0; shift < 64; shift += 8)
            {
                m_data.push_back(static_cast<std::uint8_t>((v >> shift) & 0xFF));
            }
            return *this;
        }

        ByteWriter &ByteWriter::f32(float v)
        {
            std::uint32_t bits = 0;
            static_assert(sizeof(bits) == sizeof(v), "IEEE-754 single precision expected");
            std::memcpy(&bits, &v, sizeof(bits));
            return u32(bits);
        }

        ByteWriter &ByteWriter::cstr(std::string_view s)
        {
            m_data.insert(m_data.end(), s.begin(), s.end());
            m_data.push_back(0);
            return *this;
        }

        ByteWriter &ByteWriter::raw(std::string_view s)
        {
            m_data.insert(m_data.end(), s.begin(), s.end());
            return *this;
        }

        ByteWriter &ByteWriter::bytes(const Bytes &b)
        {
            m_data.insert(m_data.end(), b.begin(), b.end());
            return *this;
        }

        // ------------------------------------------------------------
        // ByteReader
        // ------------------------------------------------------------

        bool ByteReader::take(std::size_t n, const std::uint8_t *&out)
        {
            if (remaining() < n)
            {
                m_pos = m_data.size();
                return false;
            }
            out = m_data.data() + m_pos;
            m_pos += n;
            return true;
        }

        std::optional<std::uint8_t> ByteReader::u8()
        {
            const std::uint8_t *p = nullptr;
            if (!take(1, p))
                return std::nullopt;
            return p[0];
        }

        std::optional<std::uint16_t> ByteReader::u16()
        {
            const std::uint8_t *p = nullptr;
            if (!take(2, p))
                return std::nullopt;
            return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
        }

        std::optional<std::uint32_t> ByteReader::u32()
        {
            const std::uint8_t *p = nullptr;
            if (!take(4, p))
                return std::nullopt;
            return static_cast<std::uint32_t>(p[0]) |
                   (static_cast<std::uint32_t>(p[1]) << 8) |
                   (static_cast<std::uint32_t>(p[2]) << 16) |
                   (static_cast<std::uint32_t>(p[3]) << 24);
        }

        std::optional<std::int32_t> ByteReader::i32()
        {
            const auto v = u32();
            if (!v)
                return std::nullopt;
            return static_cast<std::int32_t>(*v);
        }

        std::optional<std::uint64_t> ByteReader::u64()
        {
            const auto lo = u32();
            if (!lo)
                return std::nullopt;
            const auto hi = u32();
            if (!hi)
                return std::nullopt;
            return static_cast<std::uint64_t>(*lo) | (static_cast<std::uint64_t>(*hi) << 32);
        }

        std::optional<float> ByteReader::f32()
        {
            const auto bits = u32();
            if (!bits)
                return std::nullopt;
            float v = 0.0f;
            std::memcpy(&v, &*bits, sizeof(v));
            return v;
        }

        std::optional<std::string> ByteReader::cstr()
        {
            for (std::size_t i = m_pos; i < m_data.size(); ++i)
            {
                if (m_data[i] == 0)
                {
                    std::string s(reinterpret_cast<const char *>(m_data.data() + m_pos), i - m_pos);
                    m_pos = i + 1;
                    return s;
                }
            }
            // Unterminated string: consume the rest so callers stop.
            m_pos = m_data.size();
            return std::nullopt;
        }

        // ------------------------------------------------------------
        // Requests
        // ------------------------------------------------------------

        Bytes encodeInfoRequest(std::optional<std::int32_t> challenge)
        {
            ByteWriter w;
            w.u32(A2S::kSimpleHeader).u8(A2S::kInfoRequest).raw(A2S::kInfoPayload);
            if (challenge)
            {
                w.i32(*challenge);
            }
            return w.take();
        }

        Bytes encodePlayerRequest(std::int32_t challenge)
        {
            ByteWriter w;
            w.u32(A2S::kSimpleHeader).u8(A2S::kPlayerRequest).i32(challenge);
            return w.take();
        }

        // ------------------------------------------------------------
        // Responses
        // ------------------------------------------------------------

        PacketKind classify(const Bytes &packet) noexcept
        {
            if (packet.size() < 5)
            {
                return PacketKind::Unknown;
            }

            ByteReader r(packet);
            const auto header = r.u32();
            if (header == A2S::kSplitHeader)
            {
                return PacketKind::Split;
            }
            if (header != A2S::kSimpleHeader)
            {
                return PacketKind::Unknown;
            }

            switch (packet[4])
            {
            case A2S::kChallengeReply: return PacketKind::Challenge;
            case A2S::kInfoReply:      return PacketKind::Info;
            case A2S::kPlayerReply:    return PacketKind::Players;
            default:                   return PacketKind::Unknown;
            }
        }

        namespace
        {
            std::string opcodeError(const Bytes &packet, std::uint8_t expected)
            {
                static const char *hex = "0123456789abcdef";
                std::string got = packet.size() > 4
                    ? std::string{hex[packet[4] >> 4], hex[packet[4] & 0x0F]}
                    : std::string("none");
                return "unexpected response type 0x" + got + " (wanted 0x" +
                       std::string{hex[expected >> 4], hex[expected & 0x0F]} + ")";
            }

            bool checkHeader(const Bytes &packet, std::uint8_t opcode, ByteReader &r, std::string &err)
            {
                if (r.u32() != A2S::kSimpleHeader)
                {
                    err = "missing FFFFFFFF header";
                    return false;
                }
                if (r.u8() != opcode)
                {
                    err = opcodeError(packet, opcode);
                    return false;
                }
                return true;
            }
        } // namespace

        Decoded<std::int32_t> decodeChallenge(const Bytes &packet)
        {
            ByteReader r(packet);
            std::string err;
            if (!checkHeader(packet, A2S::kChallengeReply, r, err))
            {
                return Decoded<std::int32_t>::fail(err);
            }

            const auto challenge = r.i32();
            if (!challenge)
            {
                return Decoded<std::int32_t>::fail("challenge response too short");
            }
            return Decoded<std::int32_t>::ok(*challenge);
        }

        Decoded<Core::ServerInfo> decodeInfo(const Bytes &packet)
        {
            using Result = Decoded<Core::ServerInfo>;

            ByteReader r(packet);
            std::string err;
            if (!checkHeader(packet, A2S::kInfoReply, r, err))
            {
                return Result::fail(err);
            }

            Core::ServerInfo info;

            const auto protocol = r.u8();
            auto name           = r.cstr();
            auto map            = r.cstr();
            auto folder         = r.cstr();
            auto game           = r.cstr();
            const auto appId    = r.u16();
            const auto players  = r.u8();
            const auto maxPl    = r.u8();
            const auto bots     = r.u8();
            const auto type     = r.u8();
            const auto env      = r.u8();
            const auto vis      = r.u8();
            const auto vac      = r.u8();
            auto version        = r.cstr();

            if (!protocol || !name || !map || !folder || !game || !appId || !players ||
                !maxPl || !bots || !type || !env || !vis || !vac || !version)
            {
                return Result::fail("info response truncated");
            }

            info.protocol          = *protocol;
            info.name              = std::move(*name);
            info.map               = std::move(*map);
            info.folder            = std::move(*folder);
            info.game              = std::move(*game);
            info.appId             = *appId;
            info.players           = *players;
            info.maxPlayers        = *maxPl;
            info.bots              = *bots;
            info.serverType        = static_cast<char>(*type);
            info.environment       = static_cast<char>(*env);
            info.passwordProtected = *vis != 0;
            info.vacSecured        = *vac != 0;
            info.version           = std::move(*version);

            // Extra data flag: optional trailing fields, kept when present.
            if (const auto edf = r.u8())
            {
                if (*edf & 0x80)
                    info.gamePort = r.u16();
                if (*edf & 0x10)
                    info.steamId = r.u64();
                if (*edf & 0x40)
                {
                    info.sourceTvPort = r.u16();
                    info.sourceTvName = r.cstr();
                }
                if (*edf & 0x20)
                    info.keywords = r.cstr();
                if (*edf & 0x01)
                    info.gameId = r.u64();
            }

            return Result::ok(std::move(info));
        }

        Decoded<std::vector<Core::SnapshotPlayer>> decodePlayers(const Bytes &packet)
        {
            using Result = Decoded<std::vector<Core::SnapshotPlayer>>;

            ByteReader r(packet);
            std::string err;
            if (!checkHeader(packet, A2S::kPlayerReply, r, err))
            {
                return Result::fail(err);
            }

            // Some servers report 0 here and still list players, so the
            // count is only a hint and the buffer is read to its end.
            const auto count = r.u8();
            if (!count)
            {
                return Result::fail("player response truncated");
            }

            std::vector<Core::SnapshotPlayer> players;
            players.reserve(*count);

            while (r.remaining() > 0)
            {
                const auto index = r.u8();
                auto name        = r.cstr();
                const auto score = r.i32();
                const auto dur   = r.f32();
                if (!index || !name || !score || !dur)
                {
                    break;
                }

                Core::SnapshotPlayer p;
                p.index        = *index;
                p.name         = std::move(*name);
                p.score        = *score;
                p.durationSecs = *dur;
                players.push_back(std::move(p));
            }

            return Result::ok(std::move(players));
        }

        Decoded<SplitFragment> decodeSplitFragment(const Bytes &packet)
        {
            using Result = Decoded<SplitFragment>;

            ByteReader r(packet);
            if (r.u32() != A2S::kSplitHeader)
            {
                return Result::fail("missing FFFFFFFE header");
            }

            const auto id      = r.u32();
            const auto total   = r.u8();
            const auto index   = r.u8();
            const auto maxSize = r.u16();
            if (!id || !total || !index || !maxSize)
            {
                return Result::fail("split header truncated");
            }
            if (*id & A2S::kCompressedFlag)
            {
                return Result::fail("compressed split responses are not supported");
            }
            if (*total == 0 || *index >= *total)
            {
                return Result::fail("fragment index " + std::to_string(*index) +
                                    " out of range for total " + std::to_string(*total));
            }

            SplitFragment frag;
            frag.id      = *id;
            frag.total   = *total;
            frag.index   = *index;
            frag.maxSize = *maxSize;
            frag.payload.assign(packet.begin() + static_cast<std::ptrdiff_t>(r.position()), packet.end());
            return Result::ok(std::move(frag));
        }

        // ------------------------------------------------------------
        // FragmentAssembler
        // ------------------------------------------------------------

        FragmentAssembler::FragmentAssembler(std::chrono::milliseconds timeout)
            : m_timeout(timeout)
        {
        }

        std::optional<Bytes> FragmentAssembler::add(SplitFragment fragment, Clock::time_point now)
        {
            auto it = m_sets.find(fragment.id);
            if (it != m_sets.end() && it->second.total != fragment.total)
            {
                m_sets.erase(it);
                it = m_sets.end();
            }
            if (it == m_sets.end())
            {
                PartialSet set;
                set.total     = fragment.total;
                set.parts.resize(fragment.total);
                set.firstSeen = now;
                it = m_sets.emplace(fragment.id, std::move(set)).first;
            }

            PartialSet &set = it->second;
            auto &slot = set.parts[fragment.index];
            if (slot)
            {
                return std::nullopt;
            }
            slot = std::move(fragment.payload);
            ++set.received;

            if (set.received < set.total)
            {
                return std::nullopt;
            }

            Bytes full;
            for (auto &part : set.parts)
            {
                full.insert(full.end(), part->begin(), part->end());
            }
            m_sets.erase(it);
            return full;
        }

        std::size_t FragmentAssembler::expire(Clock::time_point now)
        {
            std::size_t dropped = 0;
            for (auto it = m_sets.begin(); it != m_sets.end();)
            {
                if (now - it->second.firstSeen >= m_timeout)
                {
                    it = m_sets.erase(it);
                    ++dropped;
                }
                else
                {
                    ++it;
                }
            }
            return dropped;
        }

    } // namespace Query
} // namespace StatTrack
