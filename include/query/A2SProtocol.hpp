#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/LiveSnapshot.hpp"

namespace StatTrack
{
    namespace Query
    {
        using Bytes = std::vector<std::uint8_t>;

        /**
         * Source-engine server query (A2S) wire constants.
         * All multi-byte integers on the wire are little endian.
         */
        namespace A2S
        {
            constexpr std::uint32_t kSimpleHeader = 0xFFFFFFFFu;
            constexpr std::uint32_t kSplitHeader  = 0xFFFFFFFEu;

            constexpr std::uint8_t kInfoRequest      = 0x54;  // 'T'
            constexpr std::uint8_t kPlayerRequest    = 0x55;  // 'U'
            constexpr std::uint8_t kChallengeReply   = 0x41;  // 'A'
            constexpr std::uint8_t kInfoReply        = 0x49;  // 'I'
            constexpr std::uint8_t kPlayerReply      = 0x44;  // 'D'

            constexpr std::int32_t kNoChallenge = -1;

            /// Split-packet request ids with this bit set carry bzip2 payloads.
            constexpr std::uint32_t kCompressedFlag = 0x80000000u;

            constexpr std::string_view kInfoPayload{"Source Engine Query\0", 20};
        } // namespace A2S

        /**
         * Little-endian writer for request packets (and test fixtures).
         */
        class ByteWriter
        {
        public:
            ByteWriter &u8(std::uint8_t v);
            ByteWriter &u16(std::uint16_t v);
            ByteWriter &i32(std::int32_t v);
            ByteWriter &u32(std::uint32_t v);
            ByteWriter &u64(std::uint64_t v);
            ByteWriter &f32(float v);
            ByteWriter &cstr(std::string_view s);   ///< Writes the terminating NUL.
            ByteWriter &raw(std::string_view s);    ///< Writes bytes as-is.
            ByteWriter &bytes(const Bytes &b);

            const Bytes &data() const noexcept { return m_data; }
            Bytes take() { return std::move(m_data); }

        private:
            Bytes m_data;
        };

        /**
         * Bounds-checked little-endian reader.
         *
         * Every read returns std::nullopt once the buffer is exhausted; the
         * reader never reads past the end.
         */
        class ByteReader
        {
        public:
            explicit ByteReader(const Bytes &data, std::size_t offset = 0) noexcept
                : m_data(data), m_pos(offset) {}

            std::optional<std::uint8_t>  u8();
            std::optional<std::uint16_t> u16();
            std::optional<std::int32_t>  i32();
            std::optional<std::uint32_t> u32();
            std::optional<std::uint64_t> u64();
            std::optional<float>         f32();
            std::optional<std::string>   cstr();

            std::size_t remaining() const noexcept
            {
                return m_pos < m_data.size() ? m_data.size() - m_pos : 0;
            }
            std::size_t position() const noexcept { return m_pos; }

        private:
            bool take(std::size_t n, const std::uint8_t *&out);

        private:
            const Bytes &m_data;
            std::size_t  m_pos;
        };

        /// Result of decoding a response: a value or a reason.
        template <typename T>
        struct Decoded
        {
            std::optional<T> value;
            std::string      error;

            explicit operator bool() const noexcept { return value.has_value(); }

            static Decoded ok(T v)
            {
                Decoded d;
                d.value = std::move(v);
                return d;
            }
            static Decoded fail(std::string why)
            {
                Decoded d;
                d.error = std::move(why);
                return d;
            }
        };

        // ---------- Requests ----------

        /// A2S_INFO; the challenge is appended when the server demanded one.
        Bytes encodeInfoRequest(std::optional<std::int32_t> challenge = std::nullopt);

        /// A2S_PLAYER; -1 asks the server for a challenge.
        Bytes encodePlayerRequest(std::int32_t challenge = A2S::kNoChallenge);

        // ---------- Responses ----------

        enum class PacketKind
        {
            Challenge,
            Info,
            Players,
            Split,
            Unknown,
        };

        /// Classify a datagram (or reassembled payload) by its header and opcode.
        PacketKind classify(const Bytes &packet) noexcept;

        Decoded<std::int32_t>                       decodeChallenge(const Bytes &packet);
        Decoded<Core::ServerInfo>                   decodeInfo(const Bytes &packet);
        Decoded<std::vector<Core::SnapshotPlayer>>  decodePlayers(const Bytes &packet);

        /**
         * One datagram of a multi-packet response (Source layout):
         *   FFFFFFFE | int32 id | u8 total | u8 index | u16 max size | payload
         */
        struct SplitFragment
        {
            std::uint32_t id = 0;
            std::uint8_t  total = 0;
            std::uint8_t  index = 0;
            std::uint16_t maxSize = 0;
            Bytes         payload;
        };

        Decoded<SplitFragment> decodeSplitFragment(const Bytes &packet);

        /**
         * FragmentAssembler
         *
         * Buffers split-response fragments by request id and returns the
         * reassembled payload once every index has been seen. Incomplete sets
         * older than the timeout are discarded by expire().
         *
         * Not thread-safe; each query owns one.
         */
        class FragmentAssembler
        {
        public:
            using Clock = std::chrono::steady_clock;

            explicit FragmentAssembler(std::chrono::milliseconds timeout);

            /**
             * Add a fragment. Returns the full payload (starting with the
             * FFFFFFFF header) when this fragment completes its set.
             * Duplicate fragments are ignored; a fragment whose total
             * disagrees with its set's total resets that set.
             */
            std::optional<Bytes> add(SplitFragment fragment, Clock::time_point now = Clock::now());

            /// Drop incomplete sets started before now - timeout. Returns how many were dropped.
            std::size_t expire(Clock::time_point now = Clock::now());

            std::size_t pendingSets() const noexcept { return m_sets.size(); }

            void clear() noexcept { m_sets.clear(); }

        private:
            struct PartialSet
            {
                std::uint8_t                  total = 0;
                std::size_t                   received = 0;
                std::vector<std::optional<Bytes>> parts;
                Clock::time_point             firstSeen;
            };

            std::chrono::milliseconds           m_timeout;
            std::map<std::uint32_t, PartialSet> m_sets;
        };

    } // namespace Query
} // namespace StatTrack
