#include "query/DatagramTransport.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "utils/StringUtils.hpp"

namespace StatTrack
{
    namespace Query
    {
        namespace
        {
            // Largest datagram a Source server sends before splitting.
            constexpr std::size_t kMaxDatagram = 1400 * 2;
        }

        std::optional<std::pair<std::string, std::string>> splitHostPort(const std::string &address)
        {
            const std::string_view sv = Utils::trim(address);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::string host;
            std::string_view rest;
            if (sv.front() == '[')
            {
                const auto close = sv.find(']');
                if (close == std::string_view::npos)
                {
                    return std::nullopt;
                }
                host = std::string(sv.substr(1, close - 1));
                rest = sv.substr(close + 1);
            }
            else
            {
                const auto colon = sv.rfind(':');
                if (colon == std::string_view::npos)
                {
                    return std::nullopt;
                }
                host = std::string(sv.substr(0, colon));
                rest = sv.substr(colon);
            }

            if (rest.size() < 2 || rest.front() != ':')
            {
                return std::nullopt;
            }
            const std::string port(rest.substr(1));
            const auto portNum = Utils::parseInteger<int>(port);
            if (host.empty() || !portNum || *portNum <= 0 || *portNum > 65535)
            {
                return std::nullopt;
            }
            return std::make_pair(host, port);
        }

        std::unique_ptr<UdpTransport> UdpTransport::connect(const std::string &address,
                                                            std::string &err)
        {
            const auto hostPort = splitHostPort(address);
            if (!hostPort)
            {
                err = "malformed query address '" + address + "' (expected host:port)";
                return nullptr;
            }

            addrinfo hints;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family   = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;

            addrinfo *res = nullptr;
            const int rc = ::getaddrinfo(hostPort->first.c_str(), hostPort->second.c_str(), &hints, &res);
            if (rc != 0)
            {
                err = "cannot resolve " + address + ": " + ::gai_strerror(rc);
                return nullptr;
            }

            std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

            for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
            {
                const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
                if (fd < 0)
                {
                    err = std::string("socket: ") + std::strerror(errno);
                    continue;
                }
                if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0)
                {
                    err = "connect " + address + ": " + std::strerror(errno);
                    ::close(fd);
                    continue;
                }
                return std::unique_ptr<UdpTransport>(new UdpTransport(fd));
            }

            if (err.empty())
            {
                err = "no usable address for " + address;
            }
            return nullptr;
        }

        UdpTransport::~UdpTransport()
        {
            if (m_fd >= 0)
            {
                ::close(m_fd);
            }
        }

        bool UdpTransport::send(const Bytes &packet, std::string &err)
        {
            const ssize_t n = ::send(m_fd, packet.data(), packet.size(), 0);
            if (n < 0 || static_cast<std::size_t>(n) != packet.size())
            {
                err = std::string("send: ") + (n < 0 ? std::strerror(errno) : "short write");
                return false;
            }
            return true;
        }

        RecvStatus UdpTransport::receive(Bytes &out, std::chrono::milliseconds timeout,
                                         std::string &err)
        {
            pollfd pfd;
            pfd.fd      = m_fd;
            pfd.events  = POLLIN;
            pfd.revents = 0;

            const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready == 0)
            {
                return RecvStatus::Timeout;
            }
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    return RecvStatus::Timeout;
                }
                err = std::string("poll: ") + std::strerror(errno);
                return RecvStatus::Error;
            }

            out.resize(kMaxDatagram);
            const ssize_t n = ::recv(m_fd, out.data(), out.size(), 0);
            if (n < 0)
            {
                // ECONNREFUSED surfaces here when the port is closed.
                err = std::string("recv: ") + std::strerror(errno);
                out.clear();
                return RecvStatus::Error;
            }
            out.resize(static_cast<std::size_t>(n));
            return RecvStatus::Ok;
        }

        TransportFactory udpTransportFactory()
        {
            return [](const std::string &address, std::string &err) -> std::unique_ptr<DatagramTransport> {
                return UdpTransport::connect(address, err);
            };
        }

    } // namespace Query
} // namespace StatTrack
