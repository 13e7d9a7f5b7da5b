#include "rvfstream/io/GrpcClient.hpp"
#include "rvfstream.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rvfstream {

namespace {
/* Compute CRC32 over a byte buffer using zlib. */
static std::uint32_t crc32_bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}
} // namespace

class GrpcClient::Impl {
public:
    Impl(const std::string& addr, Options opt)
        : serverAddr_{addr}, opt_{opt}
    {
        channel_ = grpc::CreateChannel(serverAddr_, grpc::InsecureChannelCredentials());
        stub_ = FrameRelay::NewStub(channel_);
    }

    ~Impl() { shutdown(); }

    void start(FrameHandler cb) {
        cb_ = std::move(cb);
        running_ = true;
        worker_  = std::thread([this]{ loop(); });
    }

    void shutdown() {
        running_ = false;
        {
            std::lock_guard<std::mutex> lk(ctxMtx_);
            if (ctx_) ctx_->TryCancel(); // unblocks Read()
        }
        if (worker_.joinable()) worker_.join();
    }

    std::uint64_t crcErrors() const { return crcErrors_.load(); }
    std::uint64_t relayGaps() const { return relayGaps_.load(); }
    std::uint64_t heartbeats() const { return heartbeats_.load(); }

private:
    void loop() {
        using namespace std::chrono;

        std::uint64_t expected_seq = 0;
        auto backoff = milliseconds(opt_.reconnectInitialMs);

        while (running_) {
            auto ctx = std::make_shared<grpc::ClientContext>();
            {
                std::lock_guard<std::mutex> lk(ctxMtx_);
                ctx_ = ctx;
            }
            auto stream = stub_->StreamFrames(ctx.get());

            if (!stream) {
                std::cerr << "[relay-client] connect failed\n";
                std::this_thread::sleep_for(backoff);
                backoff = std::min(backoff * 2, milliseconds(opt_.reconnectMaxMs));
                continue;
            }

            auto last_log = steady_clock::now();
            bool announced = false;

            RelayFrame msg;
            while (running_ && stream->Read(&msg)) {
                if (!announced) {
                    std::cout << "[relay-client] connected to " << serverAddr_ << "\n";
                    announced = true;
                    backoff = milliseconds(opt_.reconnectInitialMs);
                }

                if (msg.width() == 0 || msg.height() == 0 || msg.data().empty()) {
                    ++heartbeats_;
                    if (opt_.printHeartbeat) {
                        auto now = steady_clock::now();
                        if (duration_cast<milliseconds>(now - last_log).count() >= opt_.idleLogMs) {
                            std::cout << "[relay-client] heartbeat…\n";
                            last_log = now;
                        }
                    }
                    continue;
                }

                const auto calc_crc = crc32_bytes(msg.data().data(), msg.data().size());
                if (calc_crc != msg.crc32()) {
                    ++crcErrors_;
                    std::cerr << "[relay-client] CRC mismatch: relay_seq=" << msg.relay_seq()
                              << " got=" << msg.crc32()
                              << " calc=" << calc_crc << " → drop\n";
                    continue;
                }

                if (static_cast<std::size_t>(msg.width()) * msg.height() != msg.data().size()) {
                    std::cerr << "[relay-client] size mismatch: " << msg.width() << "x" << msg.height()
                              << " vs " << msg.data().size() << " bytes → drop\n";
                    continue;
                }

                const auto seq = msg.relay_seq();
                if (expected_seq != 0 && seq > expected_seq + 1) {
                    relayGaps_ += seq - expected_seq - 1;
                    std::cerr << "[relay-client] gap: expected " << (expected_seq + 1)
                              << " got " << seq << " (lost " << (seq - expected_seq - 1) << ")\n";
                } else if (expected_seq != 0 && seq <= expected_seq) {
                    // relay restarted its counter
                    std::cerr << "[relay-client] relay_seq restarted at " << seq << "\n";
                }
                expected_seq = seq;

                Frame f{
                    std::span<const std::uint8_t>(
                        reinterpret_cast<const std::uint8_t*>(msg.data().data()),
                        msg.data().size()),
                    msg.width(),
                    msg.height(),
                    std::chrono::steady_clock::now()
                };
                FrameMeta meta;
                meta.frameId      = msg.frame_id();
                meta.seq          = msg.seq();
                meta.linesWritten = msg.lines_written();
                meta.seqGaps      = msg.seq_gaps();
                if (cb_) cb_(f, meta);
            }

            if (!running_) break;
            const auto status = stream->Finish();
            std::cerr << "[relay-client] stream closed (" << status.error_message() << ") → reconnecting…\n";
            expected_seq = 0;
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, milliseconds(opt_.reconnectMaxMs));
        }
    }

private:
    std::string serverAddr_;
    Options     opt_;

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<FrameRelay::Stub> stub_;

    std::mutex ctxMtx_;
    std::shared_ptr<grpc::ClientContext> ctx_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    FrameHandler cb_;

    std::atomic<std::uint64_t> crcErrors_{0};
    std::atomic<std::uint64_t> relayGaps_{0};
    std::atomic<std::uint64_t> heartbeats_{0};
};

GrpcClient::GrpcClient(const std::string& serverAddr)
    : pimpl_{std::make_unique<Impl>(serverAddr, Options{})} {}

GrpcClient::GrpcClient(const std::string& serverAddr, Options opt)
    : pimpl_{std::make_unique<Impl>(serverAddr, opt)} {}

GrpcClient::~GrpcClient() = default;

void GrpcClient::start(FrameHandler cb) { pimpl_->start(std::move(cb)); }
void GrpcClient::shutdown()             { pimpl_->shutdown(); }

std::uint64_t GrpcClient::crcErrors() const { return pimpl_->crcErrors(); }
std::uint64_t GrpcClient::relayGaps() const { return pimpl_->relayGaps(); }
std::uint64_t GrpcClient::heartbeats() const { return pimpl_->heartbeats(); }

} // namespace rvfstream
