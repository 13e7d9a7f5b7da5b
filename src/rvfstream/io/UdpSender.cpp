#include "rvfstream/io/UdpSender.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace rvfstream {

UdpSender::UdpSender(const std::string& host, std::uint16_t port, int sendBufferBytes)
{
    target_.sin_family = AF_INET;
    target_.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &target_.sin_addr) != 1) {
        throw std::runtime_error("UdpSender: invalid IPv4 address '" + host + "'");
    }

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        throw std::runtime_error(std::string("UdpSender: socket() failed: ") + std::strerror(errno));
    }

    int sendbuf = sendBufferBytes;
    ::setsockopt(sock_, SOL_SOCKET, SO_SNDBUF, &sendbuf, sizeof(sendbuf));
}

UdpSender::~UdpSender() {
    if (sock_ >= 0) ::close(sock_);
}

bool UdpSender::send(std::span<const std::uint8_t> datagram)
{
    // a full socket buffer is retried a few times, anything else is reported once
    constexpr int kMaxRetries = 3;
    for (int attempt = 0; attempt <= kMaxRetries; ++attempt) {
        const ssize_t n = ::sendto(sock_, datagram.data(), datagram.size(), 0,
                                   reinterpret_cast<const sockaddr*>(&target_), sizeof(target_));
        if (n >= 0) {
            ++sent_;
            return true;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            continue;
        }
        std::cerr << "[udp-tx] sendto: " << std::strerror(errno) << "\n";
        break;
    }
    ++failed_;
    return false;
}

} // namespace rvfstream
