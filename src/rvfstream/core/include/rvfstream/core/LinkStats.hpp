#pragma once
#include "rvfstream/core/Frame.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace rvfstream {

/// Per-stream frame quality counters, fed with the metadata of every
/// completed frame. Safe to read from another thread while accounting.
class LinkStats {
public:
    struct Snapshot {
        std::uint64_t framesIn{0};
        std::uint64_t incomplete{0};  // linesWritten != frame height
        std::uint64_t gapFrames{0};   // seqGaps > 0
        std::uint64_t sumGaps{0};
        std::uint64_t dropped{0};     // incomplete or gap
    };

    explicit LinkStats(int expectedLines);

    void account(const FrameMeta& m);
    Snapshot snapshot() const;
    void reset();

private:
    int expectedLines_;
    std::atomic<std::uint64_t> framesIn_{0}, incomplete_{0}, gapFrames_{0}, sumGaps_{0}, dropped_{0};
};

/// Signal-loss detection for a live feed.
/// Once frames have been flowing, a pause longer than 'timeout' is a loss:
/// the last frame is forgotten and live input is suppressed for 'suppress'
/// so late packets of the old stream do not leak into the next one.
class LinkMonitor {
public:
    using Clock = std::chrono::steady_clock;

    LinkMonitor(std::chrono::milliseconds timeout, std::chrono::milliseconds suppress);

    void onFrame(Clock::time_point now);

    /// True exactly once per loss.
    bool checkSignalLost(Clock::time_point now);

    bool suppressed(Clock::time_point now) const { return now < suppressUntil_; }
    bool hasFrame() const { return hasFrame_; }
    std::uint64_t losses() const { return losses_; }

private:
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds suppress_;

    bool hasFrame_{false};
    Clock::time_point lastFrame_{};
    Clock::time_point suppressUntil_{};
    std::uint64_t losses_{0};
};

} // namespace rvfstream
