#include "query/A2SClient.hpp"

#include <algorithm>
#include <functional>
#include <thread>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace StatTrack
{
    namespace Query
    {
        namespace
        {
            constexpr std::chrono::milliseconds kReceiveSlice{100};

            // A server that answers every challenge with a new challenge is broken.
            constexpr int kMaxChallengeResends = 2;

            bool isCancelled(const std::atomic<bool> *cancel) noexcept
            {
                return cancel != nullptr && cancel->load(std::memory_order_relaxed);
            }

            enum class ExchangeState
            {
                SendRequest,
                AwaitChallenge,
                ResendWithChallenge,
                AwaitResponse,
                ReassembleIfSplit,
                Decode,
            };

            const char *toString(ExchangeState s) noexcept
            {
                switch (s)
                {
                case ExchangeState::SendRequest:         return "SendRequest";
                case ExchangeState::AwaitChallenge:      return "AwaitChallenge";
                case ExchangeState::ResendWithChallenge: return "ResendWithChallenge";
                case ExchangeState::AwaitResponse:       return "AwaitResponse";
                case ExchangeState::ReassembleIfSplit:   return "ReassembleIfSplit";
                case ExchangeState::Decode:              return "Decode";
                }
                return "?";
            }
        } // namespace

        const char *toString(QueryStatus status) noexcept
        {
            switch (status)
            {
            case QueryStatus::Ok:             return "ok";
            case QueryStatus::Timeout:        return "timeout";
            case QueryStatus::Malformed:      return "malformed";
            case QueryStatus::TransportError: return "transport-error";
            case QueryStatus::Cancelled:      return "cancelled";
            }
            return "unknown";
        }

        A2SClient::A2SClient(std::string serverId,
                             std::string address,
                             QueryOptions options,
                             TransportFactory factory)
            : m_serverId(std::move(serverId)),
              m_address(std::move(address)),
              m_options(options),
              m_factory(std::move(factory))
        {
            if (m_options.maxRetries < 0)
            {
                m_options.maxRetries = 0;
            }
        }

        bool A2SClient::sleepInterruptible(std::chrono::milliseconds duration,
                                           const std::atomic<bool> *cancel) const
        {
            const auto deadline = std::chrono::steady_clock::now() + duration;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (isCancelled(cancel))
                {
                    return false;
                }
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                std::this_thread::sleep_for(std::min(left, kReceiveSlice));
            }
            return !isCancelled(cancel);
        }

        QueryResult<Bytes> A2SClient::exchange(DatagramTransport &transport, RequestKind kind,
                                               const std::atomic<bool> *cancel,
                                               const Acceptor &accept)
        {
            using Clock = std::chrono::steady_clock;
            auto &log = Utils::getLogger();

            const std::uint8_t expected = kind == RequestKind::Info ? A2S::kInfoReply
                                                                    : A2S::kPlayerReply;
            const char *what = kind == RequestKind::Info ? "A2S_INFO" : "A2S_PLAYER";

            std::optional<std::int32_t> challenge;
            auto buildRequest = [&]() {
                return kind == RequestKind::Info
                    ? encodeInfoRequest(challenge)
                    : encodePlayerRequest(challenge.value_or(A2S::kNoChallenge));
            };

            QueryResult<Bytes> result;
            FragmentAssembler  assembler(m_options.fragmentTimeout);
            std::string        lastError;
            bool               sawMalformed = false;
            bool               transportFailed = false;
            auto               backoff = m_options.backoff;

            for (int attempt = 0; attempt <= m_options.maxRetries; ++attempt)
            {
                if (attempt > 0)
                {
                    if (!sleepInterruptible(backoff, cancel))
                    {
                        result.status = QueryStatus::Cancelled;
                        result.error  = "cancelled";
                        return result;
                    }
                    backoff *= 2;
                }
                if (isCancelled(cancel))
                {
                    result.status = QueryStatus::Cancelled;
                    result.error  = "cancelled";
                    return result;
                }

                ExchangeState state = ExchangeState::SendRequest;
                ++result.attempts;

                std::string err;
                if (!transport.send(buildRequest(), err))
                {
                    lastError       = err;
                    transportFailed = true;
                    continue;
                }

                state = challenge ? ExchangeState::AwaitResponse : ExchangeState::AwaitChallenge;
                int  challengeResends = 0;
                auto deadline = Clock::now() + m_options.timeout;

                while (true)
                {
                    const auto now = Clock::now();
                    if (now >= deadline)
                    {
                        lastError = std::string("no ") + what + " response in " +
                                    std::to_string(m_options.timeout.count()) + " ms (state " +
                                    toString(state) + ")";
                        break;
                    }

                    const auto slice = std::min(
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
                        kReceiveSlice);

                    Bytes packet;
                    const RecvStatus rs = transport.receive(packet, slice, err);
                    if (isCancelled(cancel))
                    {
                        result.status = QueryStatus::Cancelled;
                        result.error  = "cancelled";
                        return result;
                    }
                    if (rs == RecvStatus::Timeout)
                    {
                        continue;
                    }
                    if (rs == RecvStatus::Error)
                    {
                        lastError       = err;
                        transportFailed = true;
                        break;
                    }

                    assembler.expire();

                    PacketKind pk = classify(packet);
                    if (pk == PacketKind::Split)
                    {
                        state = ExchangeState::ReassembleIfSplit;
                        auto frag = decodeSplitFragment(packet);
                        if (!frag)
                        {
                            lastError    = frag.error;
                            sawMalformed = true;
                            continue;
                        }
                        auto full = assembler.add(std::move(*frag.value));
                        if (!full)
                        {
                            continue;
                        }
                        packet = std::move(*full);
                        pk     = classify(packet);
                    }

                    if (pk == PacketKind::Challenge)
                    {
                        const auto c = decodeChallenge(packet);
                        if (!c)
                        {
                            lastError    = c.error;
                            sawMalformed = true;
                            continue;
                        }
                        if (challengeResends >= kMaxChallengeResends)
                        {
                            lastError    = "server keeps answering with challenges";
                            sawMalformed = true;
                            break;
                        }

                        state     = ExchangeState::ResendWithChallenge;
                        challenge = *c.value;
                        ++challengeResends;
                        if (!transport.send(buildRequest(), err))
                        {
                            lastError       = err;
                            transportFailed = true;
                            break;
                        }
                        state    = ExchangeState::AwaitResponse;
                        deadline = Clock::now() + m_options.timeout;
                        continue;
                    }

                    if (packet.size() > 4 && pk != PacketKind::Unknown && packet[4] == expected)
                    {
                        state = ExchangeState::Decode;
                        std::string decodeErr;
                        if (!accept(packet, decodeErr))
                        {
                            lastError    = decodeErr;
                            sawMalformed = true;
                            log.debug("[" + m_serverId + "] undecodable " + what + " reply: " + decodeErr);
                            break;
                        }
                        log.trace("[" + m_serverId + "] " + what + " answered after " +
                                  std::to_string(result.attempts) + " attempt(s)");
                        result.status = QueryStatus::Ok;
                        result.value  = std::move(packet);
                        return result;
                    }

                    // Stale answer to an earlier request or noise: keep waiting.
                    log.trace("[" + m_serverId + "] ignoring unexpected " + what + " reply packet");
                }
            }

            if (sawMalformed)
                result.status = QueryStatus::Malformed;
            else if (transportFailed)
                result.status = QueryStatus::TransportError;
            else
                result.status = QueryStatus::Timeout;
            result.error = lastError;
            return result;
        }

        QueryResult<Core::ServerInfo> A2SClient::queryInfo(DatagramTransport &transport,
                                                           const std::atomic<bool> *cancel)
        {
            QueryResult<Core::ServerInfo> out;
            const auto raw = exchange(transport, RequestKind::Info, cancel,
                                      [&out](const Bytes &payload, std::string &err) {
                                          auto decoded = decodeInfo(payload);
                                          if (!decoded)
                                          {
                                              err = std::move(decoded.error);
                                              return false;
                                          }
                                          out.value = std::move(decoded.value);
                                          return true;
                                      });
            out.status   = raw.status;
            out.error    = raw.error;
            out.attempts = raw.attempts;
            return out;
        }

        QueryResult<std::vector<Core::SnapshotPlayer>> A2SClient::queryPlayers(
            DatagramTransport &transport, const std::atomic<bool> *cancel)
        {
            QueryResult<std::vector<Core::SnapshotPlayer>> out;
            const auto raw = exchange(transport, RequestKind::Players, cancel,
                                      [&out](const Bytes &payload, std::string &err) {
                                          auto decoded = decodePlayers(payload);
                                          if (!decoded)
                                          {
                                              err = std::move(decoded.error);
                                              return false;
                                          }
                                          out.value = std::move(decoded.value);
                                          return true;
                                      });
            out.status   = raw.status;
            out.error    = raw.error;
            out.attempts = raw.attempts;
            return out;
        }

        Core::LiveSnapshot A2SClient::query(const std::atomic<bool> *cancel)
        {
            auto &log = Utils::getLogger();

            Core::LiveSnapshot snap;
            snap.serverId  = m_serverId;
            snap.queriedAt = Utils::now();
            snap.reachable = false;

            std::string err;
            std::unique_ptr<DatagramTransport> transport = m_factory(m_address, err);
            if (!transport)
            {
                snap.error = err.empty() ? "cannot create transport" : err;
                log.debug("[" + m_serverId + "] query transport: " + snap.error);
                return snap;
            }

            if (m_options.queryInfo)
            {
                auto info = queryInfo(*transport, cancel);
                if (info.status == QueryStatus::Ok)
                {
                    snap.info = std::move(info.value);
                }
                else if (info.status == QueryStatus::Malformed)
                {
                    log.debug("[" + m_serverId + "] A2S_INFO undecodable: " + info.error);
                }
                else
                {
                    snap.error = std::string(toString(info.status)) + ": " + info.error;
                    return snap;
                }
            }

            auto players = queryPlayers(*transport, cancel);
            if (players.status != QueryStatus::Ok)
            {
                snap.error = std::string(toString(players.status)) + ": " + players.error;
                return snap;
            }

            snap.players   = std::move(*players.value);
            snap.reachable = true;
            snap.queriedAt = Utils::now();
            return snap;
        }

    } // namespace Query
} // namespace StatTrack
