#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "query/A2SProtocol.hpp"

namespace StatTrack
{
    namespace Query
    {
        enum class RecvStatus
        {
            Ok,
            Timeout,
            Error,
        };

        /**
         * DatagramTransport
         *
         * Connected datagram channel to one query endpoint. The A2S client
         * only talks through this interface so tests can script a server.
         */
        class DatagramTransport
        {
        public:
            virtual ~DatagramTransport() = default;

            /// Send one datagram. Returns false and fills err on failure.
            virtual bool send(const Bytes &packet, std::string &err) = 0;

            /// Wait up to timeout for one datagram.
            virtual RecvStatus receive(Bytes &out, std::chrono::milliseconds timeout,
                                       std::string &err) = 0;
        };

        /// Creates a transport for "host:port"; returns nullptr and fills err on failure.
        using TransportFactory =
            std::function<std::unique_ptr<DatagramTransport>(const std::string &address,
                                                             std::string &err)>;

        /**
         * UdpTransport
         *
         * POSIX UDP socket connect()ed to the query endpoint, so only
         * datagrams from that peer are received.
         */
        class UdpTransport : public DatagramTransport
        {
        public:
            /// Resolve "host:port" and connect a UDP socket to it.
            static std::unique_ptr<UdpTransport> connect(const std::string &address,
                                                         std::string &err);

            UdpTransport(const UdpTransport &)            = delete;
            UdpTransport &operator=(const UdpTransport &) = delete;

            ~UdpTransport() override;

            bool send(const Bytes &packet, std::string &err) override;
            RecvStatus receive(Bytes &out, std::chrono::milliseconds timeout,
                               std::string &err) override;

        private:
            explicit UdpTransport(int fd) noexcept : m_fd(fd) {}

        private:
            int m_fd = -1;
        };

        /// Factory producing UdpTransport instances.
        TransportFactory udpTransportFactory();

        /// Split "host:port" (IPv6 as "[addr]:port"). std::nullopt if malformed.
        std::optional<std::pair<std::string, std::string>> splitHostPort(const std::string &address);

    } // namespace Query
} // namespace StatTrack
