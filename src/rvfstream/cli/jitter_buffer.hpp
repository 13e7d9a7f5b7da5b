#pragma once
#include <rvfstream/core/Config.hpp>
#include <rvfstream/core/Frame.hpp>
#include <deque>
#include <vector>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <chrono>

/*
  A completed frame on its way from the receiver thread to the consumer.
  'buf' is the reassembler's copy, owned here.
*/
struct RecvFrame {
    std::vector<std::uint8_t> buf;                    // W*H Gray8 bytes
    std::uint32_t width{0}, height{0};
    rvfstream::FrameMeta meta{};
    std::chrono::steady_clock::time_point t_arrive{}; // local completion time

    rvfstream::Frame view() const {
        return rvfstream::Frame{
            std::span<const std::uint8_t>(buf.data(), buf.size()),
            width, height, t_arrive
        };
    }
};

/*
  Thread-safe bounded queue between the receiver thread (producer) and the
  consumer thread, so slow consumers never stall apply().

  - Oldest: drop the oldest frame when the queue is full.
  - Newest: drop the new incoming frame instead.
  'drops' is increased whenever a frame is dropped.
*/
class JitterBuffer {
public:
    JitterBuffer(std::size_t capacity, rvfstream::DropPolicy drop) : cap_(capacity), drop_(drop) {}

    void push(RecvFrame&& rf, std::atomic<std::uint64_t>& drops) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (q_.size() >= cap_) {
                ++drops;
                if (drop_ == rvfstream::DropPolicy::Newest) return;
                q_.pop_front();
            }
            q_.push_back(std::move(rf));
        }
        cv_.notify_one();
    }

    // Wait up to 'wait_ms' for a frame. False on timeout.
    bool pop_wait(RecvFrame& out, int wait_ms) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait_for(lk, std::chrono::milliseconds(wait_ms), [this]{ return !q_.empty(); }))
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

private:
    std::size_t cap_;
    rvfstream::DropPolicy drop_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<RecvFrame> q_;
};
