#include "rvfstream/io/UdpReceiver.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <errno.h>

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rvfstream {

namespace {
// Larger than any RVF datagram (21 + 255*320) and any jumbo frame.
constexpr std::size_t kMaxDatagram = 96 * 1024;
} // namespace

class UdpReceiver::Impl {
public:
    explicit Impl(Options opt) : opt_{opt} {
        sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (sock_ < 0) {
            throw std::runtime_error(std::string("UdpReceiver: socket() failed: ") + std::strerror(errno));
        }

        int optval = 1;
        ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

        int rcvbuf = opt_.recvBufferBytes;
        if (::setsockopt(sock_, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
            std::cerr << "[udp-rx] SO_RCVBUF=" << rcvbuf << " rejected: " << std::strerror(errno) << "\n";
        }

        // receive timeout: the loop wakes up to run the tick handler and see shutdown
        timeval tv{};
        tv.tv_sec  = opt_.pollMs / 1000;
        tv.tv_usec = (opt_.pollMs % 1000) * 1000;
        ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_port        = htons(opt_.port);
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            const std::string err = std::strerror(errno);
            ::close(sock_);
            sock_ = -1;
            throw std::runtime_error("UdpReceiver: bind to port " + std::to_string(opt_.port) + " failed: " + err);
        }

        sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        if (::getsockname(sock_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            port_ = ntohs(bound.sin_port);
        } else {
            port_ = opt_.port;
        }
        std::cout << "[udp-rx] listening on 0.0.0.0:" << port_ << "\n";
    }

    ~Impl() {
        shutdown();
        if (sock_ >= 0) ::close(sock_);
    }

    void start(ChunkHandler onChunk, TickHandler onTick) {
        if (running_) return;
        onChunk_ = std::move(onChunk);
        onTick_  = std::move(onTick);
        running_ = true;
        worker_  = std::thread([this]{ loop(); });
    }

    void shutdown() {
        running_ = false;
        if (worker_.joinable()) worker_.join();
    }

    std::uint16_t boundPort() const { return port_; }

    Counters counters() const {
        Counters c;
        c.datagrams = datagrams_.load();
        c.bytes     = bytes_.load();
        c.nonRvf    = nonRvf_.load();
        c.malformed = malformed_.load();
        c.chunks    = chunks_.load();
        return c;
    }

private:
    void loop() {
        std::vector<std::uint8_t> buf(kMaxDatagram);

        while (running_) {
            const ssize_t n = ::recvfrom(sock_, buf.data(), buf.size(), 0, nullptr, nullptr);

            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    std::cerr << "[udp-rx] recvfrom: " << std::strerror(errno) << "\n";
                    std::this_thread::sleep_for(std::chrono::milliseconds(opt_.pollMs));
                }
            } else {
                handleDatagram(std::span<const std::uint8_t>(buf.data(), static_cast<std::size_t>(n)));
            }

            if (onTick_) onTick_(std::chrono::steady_clock::now());
        }
    }

    void handleDatagram(std::span<const std::uint8_t> d) {
        ++datagrams_;
        bytes_ += d.size();

        const auto off = hasMagic(d) ? std::optional<std::size_t>{0} : findMagic(d);
        if (!off) {
            ++nonRvf_;
            if (opt_.printDrops) std::cerr << "[udp-rx] drop: no RVFU marker (len=" << d.size() << ")\n";
            return;
        }

        auto chunk = parseChunk(d.subspan(*off));
        if (!chunk) {
            ++malformed_;
            if (opt_.printDrops) std::cerr << "[udp-rx] drop: malformed RVFU header (len=" << d.size() << ")\n";
            return;
        }

        ++chunks_;
        if (onChunk_) onChunk_(*chunk);
    }

private:
    Options opt_;
    int sock_{-1};
    std::uint16_t port_{0};

    std::atomic<bool> running_{false};
    std::thread worker_;
    ChunkHandler onChunk_;
    TickHandler  onTick_;

    std::atomic<std::uint64_t> datagrams_{0}, bytes_{0}, nonRvf_{0}, malformed_{0}, chunks_{0};
};

UdpReceiver::UdpReceiver(Options opt)
    : pimpl_{std::make_unique<Impl>(opt)} {}

UdpReceiver::~UdpReceiver() = default;

void UdpReceiver::start(ChunkHandler onChunk, TickHandler onTick) {
    pimpl_->start(std::move(onChunk), std::move(onTick));
}
void UdpReceiver::shutdown()                       { pimpl_->shutdown(); }
std::uint16_t UdpReceiver::boundPort() const       { return pimpl_->boundPort(); }
UdpReceiver::Counters UdpReceiver::counters() const { return pimpl_->counters(); }

} // namespace rvfstream
