#pragma once

#include "rvfstream/core/Frame.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rvfstream {

class GrpcClient {
public:
    struct Options {
        int   reconnectInitialMs = 300;   // initial reconnect backoff (ms)
        int   reconnectMaxMs     = 8000;  // maximum reconnect backoff (ms)
        int   idleLogMs          = 2500;  // heartbeat log period when idle (ms)
        bool  printHeartbeat     = true;  // print periodic heartbeat logs
    };

    // The frame view is only valid during the call.
    using FrameHandler = std::function<void(const Frame&, const FrameMeta&)>;

    explicit GrpcClient(const std::string& serverAddr);     // constructor with default options
    GrpcClient(const std::string& serverAddr, Options opt); // constructor with custom options
    ~GrpcClient();

    void start(FrameHandler cb);
    void shutdown();

    std::uint64_t crcErrors() const;
    std::uint64_t relayGaps() const;
    std::uint64_t heartbeats() const;  // empty messages skipped, never passed to the handler

    GrpcClient(const GrpcClient&)            = delete;
    GrpcClient& operator=(const GrpcClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace rvfstream
