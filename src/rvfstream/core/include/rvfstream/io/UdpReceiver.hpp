#pragma once

#include "rvfstream/protocol/RvfProtocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace rvfstream {

/* Receives RVF datagrams on a UDP port and hands parsed chunks to a
   handler, one at a time, from a single worker thread.

   - datagrams without "RVFU" in their first 64 bytes are counted and skipped;
   - datagrams that fail parseChunk() are counted and skipped;
   - the tick handler runs after every datagram and every poll timeout,
     on the same thread, so liveness checks can touch the reassembler. */
class UdpReceiver {
public:
    struct Options {
        std::uint16_t port = 50070;        // 0 -> ephemeral, see boundPort()
        int recvBufferBytes = 4 * 1024 * 1024;
        int pollMs = 100;
        bool printDrops = false;           // log every non-RVF / malformed datagram
    };

    struct Counters {
        std::uint64_t datagrams{0};
        std::uint64_t bytes{0};
        std::uint64_t nonRvf{0};
        std::uint64_t malformed{0};
        std::uint64_t chunks{0};
    };

    using ChunkHandler = std::function<void(const Chunk&)>;
    using TickHandler  = std::function<void(std::chrono::steady_clock::time_point)>;

    // Binds immediately. Throws std::runtime_error on socket/bind failure.
    explicit UdpReceiver(Options opt);
    ~UdpReceiver();

    void start(ChunkHandler onChunk, TickHandler onTick = {});
    void shutdown();

    std::uint16_t boundPort() const;
    Counters counters() const;

    UdpReceiver(const UdpReceiver&)            = delete;
    UdpReceiver& operator=(const UdpReceiver&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace rvfstream
