#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <span>
#include <string>

namespace rvfstream {

/* Sends datagrams to one IPv4 destination.
   Throws std::runtime_error if the socket cannot be created or the
   address does not parse. */
class UdpSender {
public:
    UdpSender(const std::string& host, std::uint16_t port, int sendBufferBytes = 1 << 20);
    ~UdpSender();

    // false on a send error (already logged).
    bool send(std::span<const std::uint8_t> datagram);

    std::uint64_t sent() const { return sent_; }
    std::uint64_t failed() const { return failed_; }

    UdpSender(const UdpSender&)            = delete;
    UdpSender& operator=(const UdpSender&) = delete;

private:
    int sock_{-1};
    sockaddr_in target_{};
    std::uint64_t sent_{0};
    std::uint64_t failed_{0};
};

} // namespace rvfstream
