#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/LiveSnapshot.hpp"
#include "query/A2SProtocol.hpp"
#include "query/DatagramTransport.hpp"

namespace StatTrack
{
    namespace Query
    {
        enum class QueryStatus
        {
            Ok,
            Timeout,         ///< No usable answer within timeout and retries.
            Malformed,       ///< Answers arrived but could not be decoded.
            TransportError,  ///< Socket could not be created / used.
            Cancelled,
        };

        const char *toString(QueryStatus status) noexcept;

        struct QueryOptions
        {
            std::chrono::milliseconds timeout{2000};          ///< Per attempt.
            int                       maxRetries = 2;         ///< Attempts after the first.
            std::chrono::milliseconds backoff{250};           ///< Doubled after each retry.
            std::chrono::milliseconds fragmentTimeout{3000};
            bool                      queryInfo = true;       ///< Also ask A2S_INFO.
        };

        template <typename T>
        struct QueryResult
        {
            QueryStatus      status = QueryStatus::Timeout;
            std::optional<T> value;
            std::string      error;
            int              attempts = 0;  ///< Requests sent, challenge re-sends excluded.
        };

        /**
         * A2SClient
         *
         * Responsibilities:
         *  - Run one Source-engine query against one server and decode the
         *    answer into a LiveSnapshot.
         *  - Drive the per-request state machine:
         *      SendRequest -> AwaitChallenge -> ResendWithChallenge
         *                  -> AwaitResponse -> ReassembleIfSplit -> Decode
         *  - Bound every request by timeout, retries and exponential backoff.
         *
         * Design notes:
         *  - Never throws for network or protocol problems; a failed query
         *    yields a snapshot with reachable == false.
         *  - The cancel flag is checked between receive slices and backoff
         *    sleeps, so stop() of the owning poller abandons a query quickly.
         *  - One transport per query() call; the client itself keeps no
         *    socket open between cycles.
         */
        class A2SClient
        {
        public:
            A2SClient(std::string serverId,
                      std::string address,
                      QueryOptions options = QueryOptions{},
                      TransportFactory factory = udpTransportFactory());

            A2SClient(const A2SClient &)            = delete;
            A2SClient &operator=(const A2SClient &) = delete;

            /// Query info (optional) and players; never throws for network errors.
            Core::LiveSnapshot query(const std::atomic<bool> *cancel = nullptr);

            QueryResult<Core::ServerInfo> queryInfo(DatagramTransport &transport,
                                                    const std::atomic<bool> *cancel = nullptr);

            QueryResult<std::vector<Core::SnapshotPlayer>> queryPlayers(DatagramTransport &transport,
                                                                        const std::atomic<bool> *cancel = nullptr);

            const std::string &serverId() const noexcept { return m_serverId; }
            const std::string &address() const noexcept { return m_address; }
            const QueryOptions &options() const noexcept { return m_options; }

        private:
            enum class RequestKind
            {
                Info,
                Players,
            };

            /// Decodes a complete response; false (with a reason) makes the attempt fail.
            using Acceptor = std::function<bool(const Bytes &payload, std::string &err)>;

            /// Run one request through the state machine until accept() takes a response.
            QueryResult<Bytes> exchange(DatagramTransport &transport, RequestKind kind,
                                        const std::atomic<bool> *cancel, const Acceptor &accept);

            bool sleepInterruptible(std::chrono::milliseconds duration,
                                    const std::atomic<bool> *cancel) const;

        private:
            std::string      m_serverId;
            std::string      m_address;
            QueryOptions     m_options;
            TransportFactory m_factory;
        };

    } // namespace Query
} // namespace StatTrack
