// src/core/relay/raw_sender.cpp
#include "raw_sender.hpp"
#include "network_utils.hpp"
#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace UdpRelay
{
    namespace Relay
    {
        RawSocketSender::RawSocketSender()
            : sockfd_(-1),
              ifindex_(0),
              local_addr_(0)
        {
        }

        RawSocketSender::~RawSocketSender()
        {
            closeSocket();
        }

        RelayStatus RawSocketSender::open(const std::string &interface, uint32_t local_addr)
        {
            closeSocket();
            interface_ = interface;
            local_addr_ = local_addr;

            ifindex_ = if_nametoindex(interface.c_str());
            if (ifindex_ == 0)
            {
                return RelayStatus(RelayError::INTERFACE_UNAVAILABLE,
                                   "if_nametoindex(" + interface + ") failed: " + std::strerror(errno));
            }

            sockfd_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_UDP);
            if (sockfd_ < 0)
            {
                return RelayStatus(RelayError::SOCKET_FAILED,
                                   "Failed to create raw socket for " + interface + ": " + std::strerror(errno));
            }

            int on = 1;
            if (setsockopt(sockfd_, IPPROTO_IP, IP_HDRINCL, &on, sizeof(on)) < 0)
            {
                std::string message = "IP_HDRINCL on " + interface + ": " + std::strerror(errno);
                closeSocket();
                return RelayStatus(RelayError::SOCKET_FAILED, message);
            }

            if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0)
            {
                std::string message = "SO_BROADCAST on " + interface + ": " + std::strerror(errno);
                closeSocket();
                return RelayStatus(RelayError::SOCKET_FAILED, message);
            }

            struct sockaddr_in local;
            std::memset(&local, 0, sizeof(local));
            local.sin_family = AF_INET;
            local.sin_addr.s_addr = local_addr;

            if (::bind(sockfd_, reinterpret_cast<struct sockaddr *>(&local), sizeof(local)) < 0)
            {
                std::string message = "Failed to bind raw socket to " +
                                      Common::NetworkUtils::networkOrderToString(local_addr) + " on " +
                                      interface + ": " + std::strerror(errno);
                closeSocket();
                return RelayStatus(RelayError::SOCKET_FAILED, message);
            }

            spdlog::info("{}: raw socket bound to {} (ifindex {})", interface,
                         Common::NetworkUtils::networkOrderToString(local_addr), ifindex_);
            return RelayStatus();
        }

        bool RawSocketSender::send(const Common::OutboundDatagram &datagram, std::string &error)
        {
            if (sockfd_ < 0)
            {
                error = "socket is not open";
                return false;
            }

            struct sockaddr_in dst;
            std::memset(&dst, 0, sizeof(dst));
            dst.sin_family = AF_INET;
            dst.sin_addr.s_addr = datagram.destination();

            struct iovec iov;
            iov.iov_base = const_cast<uint8_t *>(datagram.bytes.data());
            iov.iov_len = datagram.bytes.size();

            union
            {
                char buf[CMSG_SPACE(sizeof(struct in_pktinfo))];
                struct cmsghdr align;
            } control;
            std::memset(&control, 0, sizeof(control));

            struct msghdr msg;
            std::memset(&msg, 0, sizeof(msg));
            msg.msg_name = &dst;
            msg.msg_namelen = sizeof(dst);
            msg.msg_iov = &iov;
            msg.msg_iovlen = 1;
            msg.msg_control = control.buf;
            msg.msg_controllen = sizeof(control.buf);

            struct cmsghdr *cmsg = CMSG_FIRSTHDR(&msg);
            cmsg->cmsg_level = IPPROTO_IP;
            cmsg->cmsg_type = IP_PKTINFO;
            cmsg->cmsg_len = CMSG_LEN(sizeof(struct in_pktinfo));

            struct in_pktinfo pktinfo;
            std::memset(&pktinfo, 0, sizeof(pktinfo));
            pktinfo.ipi_ifindex = static_cast<int>(ifindex_);
            pktinfo.ipi_spec_dst.s_addr = datagram.source();
            std::memcpy(CMSG_DATA(cmsg), &pktinfo, sizeof(pktinfo));

            ssize_t sent = ::sendmsg(sockfd_, &msg, 0);
            if (sent < 0)
            {
                error = std::strerror(errno);
                return false;
            }

            if (static_cast<size_t>(sent) != datagram.bytes.size())
            {
                error = "short write (" + std::to_string(sent) + " of " +
                        std::to_string(datagram.bytes.size()) + " bytes)";
                return false;
            }

            return true;
        }

        void RawSocketSender::closeSocket()
        {
            if (sockfd_ >= 0)
            {
                ::close(sockfd_);
                sockfd_ = -1;
            }
        }

    } // namespace Relay
} // namespace UdpRelay
