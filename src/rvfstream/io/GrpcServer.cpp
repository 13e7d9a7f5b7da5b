#include "rvfstream/io/GrpcServer.hpp"
#include "rvfstream.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rvfstream {

//------------------------------------------------------------------------------
// Small helpers (time, CRC)
//------------------------------------------------------------------------------
namespace {
static std::uint64_t to_ns(std::chrono::steady_clock::time_point tp) {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(duration_cast<nanoseconds>(tp.time_since_epoch()).count());
}
static std::uint32_t crc32_bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}
} // namespace

//------------------------------------------------------------------------------
// gRPC relay server
//  - bounded queue of completed frames (drop policy on overflow)
//  - bidi stream; we only write, inbound is drained
//  - heartbeats while there is nothing to send
//------------------------------------------------------------------------------
class GrpcServer::Impl : public FrameRelay::Service {
public:
    Impl(std::uint16_t port, Options opt)
        : opt_{opt}
        , addr_("0.0.0.0:" + std::to_string(port))
    {
        grpc::ServerBuilder b;
        b.AddListeningPort(addr_, grpc::InsecureServerCredentials(), &port_);
        b.RegisterService(this);
        server_ = b.BuildAndStart();
        if (!server_ || port_ == 0) {
            throw std::runtime_error("GrpcServer: failed to listen at " + addr_);
        }
        std::cout << "[relay-server] listening at 0.0.0.0:" << port_ << "\n";
        running_ = true;
    }

    ~Impl() override {
        running_ = false;
        cv_.notify_all();
        if (server_) server_->Shutdown();
    }

    ::grpc::Status StreamFrames(::grpc::ServerContext* ctx,
                                ::grpc::ServerReaderWriter<RelayFrame, RelayFrame>* stream) override
    {
        using namespace std::chrono;

        std::atomic<bool> drain_running{true};
        std::thread drain([&]{
            RelayFrame dummy;
            while (drain_running && stream->Read(&dummy)) {
                // viewers do not send anything meaningful
            }
        });

        std::cout << "[relay-server] viewer connected: " << ctx->peer() << "\n";

        while (running_ && !ctx->IsCancelled()) {
            QItem item;
            bool has_item = false;

            {
                std::unique_lock<std::mutex> lk(m_);
                if (queue_.empty()) {
                    cv_.wait_for(lk, milliseconds(opt_.heartbeatMs));
                }
                if (!queue_.empty()) {
                    item = std::move(queue_.front());
                    queue_.pop_front();
                    has_item = true;
                }
            }

            RelayFrame msg;
            if (has_item) {
                msg.set_width(item.w);
                msg.set_height(item.h);
                msg.set_timestamp_ns(item.ts_ns);
                msg.set_data(reinterpret_cast<const char*>(item.data.data()), item.data.size());
                msg.set_relay_seq(seq_.fetch_add(1, std::memory_order_relaxed) + 1);
                msg.set_crc32(crc32_bytes(item.data.data(), item.data.size()));
                msg.set_frame_id(item.meta.frameId);
                msg.set_seq(item.meta.seq);
                msg.set_lines_written(item.meta.linesWritten);
                msg.set_seq_gaps(item.meta.seqGaps);

                if (!stream->Write(msg)) break;
            } else {
                // heartbeat: width = height = 0, no data
                msg.set_relay_seq(seq_.load(std::memory_order_relaxed));
                if (!stream->Write(msg)) break;
            }
        }

        // the reader only returns once the client half-closes or the call ends
        ctx->TryCancel();
        drain_running = false;
        if (drain.joinable()) drain.join();
        std::cout << "[relay-server] viewer disconnected: " << ctx->peer() << "\n";
        return ::grpc::Status::OK;
    }

    void push(const Frame& f, const FrameMeta& meta) {
        QItem q;
        q.w     = f.width;
        q.h     = f.height;
        q.ts_ns = to_ns(f.timestamp);
        q.meta  = meta;

        const std::size_t need = std::min(f.bytes(), f.data.size());
        q.data.resize(need);
        if (need) std::memcpy(q.data.data(), f.data.data(), need);

        {
            std::lock_guard<std::mutex> lk(m_);
            if (static_cast<int>(queue_.size()) >= opt_.maxQueue) {
                ++drops_;
                if (opt_.dropOldest && !queue_.empty()) queue_.pop_front();
                else return;
            }
            queue_.push_back(std::move(q));
        }
        cv_.notify_one();
    }

    std::uint64_t drops() const { return drops_.load(); }
    std::uint16_t port() const { return static_cast<std::uint16_t>(port_); }

private:
    struct QItem {
        std::vector<std::uint8_t> data;
        std::uint32_t w{0}, h{0};
        std::uint64_t ts_ns{0};
        FrameMeta     meta{};
    };

    Options opt_;
    std::string addr_;
    int port_{0};
    std::unique_ptr<grpc::Server> server_;

    std::mutex m_;
    std::condition_variable cv_;
    std::deque<QItem> queue_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> seq_{0};
    std::atomic<std::uint64_t> drops_{0};
};

GrpcServer::GrpcServer(std::uint16_t port)
    : p_(std::make_unique<Impl>(port, Options{})) {}

GrpcServer::GrpcServer(std::uint16_t port, Options opt)
    : p_(std::make_unique<Impl>(port, opt)) {}

GrpcServer::~GrpcServer() = default;

void GrpcServer::pushFrame(const Frame& f, const FrameMeta& meta) { p_->push(f, meta); }

std::uint64_t GrpcServer::queueDrops() const { return p_->drops(); }

std::uint16_t GrpcServer::boundPort() const { return p_->port(); }

} // namespace rvfstream
