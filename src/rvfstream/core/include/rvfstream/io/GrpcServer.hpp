#pragma once

#include "rvfstream/core/Frame.hpp"

#include <cstdint>
#include <memory>

namespace rvfstream {

/* Serves completed frames to remote viewers over a gRPC stream. */
class GrpcServer {
public:
    struct Options {
        int   maxQueue        = 64;    // frame queue limit
        bool  dropOldest      = true;  // true: evict old frames; false: reject new ones
        int   heartbeatMs     = 1000;  // heartbeat period while idle
    };

    // port 0 picks a free port, see boundPort(). Throws std::runtime_error
    // if the server cannot listen.
    explicit GrpcServer(std::uint16_t port);
    GrpcServer(std::uint16_t port, Options opt);
    ~GrpcServer();

    void pushFrame(const Frame& f, const FrameMeta& meta);

    std::uint64_t queueDrops() const;
    std::uint16_t boundPort() const;

    GrpcServer(const GrpcServer&)            = delete;
    GrpcServer& operator=(const GrpcServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> p_;
};

} // namespace rvfstream
