#pragma once

#include "rvfstream/protocol/RvfProtocol.hpp"

#include <cstddef>
#include <cstdint>

namespace rvfstream {

/* Drop strategy of bounded frame queues. */
enum class DropPolicy : std::uint8_t {
    Oldest = 0,
    Newest = 1
};

/* Runtime configuration of the receive/send pipeline.
   Filled from command-line options; every field has a usable default. */
struct Config {
    std::uint16_t port {rvf::kDefaultPort};   // UDP port to bind / send to
    int recvBufferBytes {4 * 1024 * 1024};    // SO_RCVBUF for the UDP socket
    int pollMs {100};                         // receive timeout between liveness checks

    int signalLostMs {2000};                  // no frame for this long -> signal lost
    int suppressAfterLossMs {1000};           // ignore late chunks after a loss

    std::size_t queueCapacity {64};           // completed frames waiting for the consumer
    DropPolicy  drop {DropPolicy::Oldest};

    int linesPerChunk {4};                    // sender side slicing
    int healthMs {2000};                      // period of the [health] line
    int relayPort {-1};                       // >=0 -> serve completed frames via gRPC
};

} // namespace rvfstream
