#pragma once
#include "rvfstream/core/Frame.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace rvfstream {

/// Turns a stream of RVF chunks into completed 320x80 Gray8 frames.
///
/// - single writer: one thread calls apply() for one stream;
/// - malformed chunks are dropped without a trace except in stats();
/// - a frame is complete when a chunk carries the end-of-frame flag,
///   whatever number of rows arrived;
/// - the frame buffer is reused and never cleared, rows that the next
///   frame does not rewrite keep their old content.
class Reassembler {
public:
    static constexpr int W = rvf::kWidth;
    static constexpr int H = rvf::kHeight;

    /// Receives an owned copy of the frame; called on the apply() thread.
    using FrameReadyHandler = std::function<void(std::vector<std::uint8_t> frame, const FrameMeta& meta)>;

    /// Cumulative counters since construction (not touched by the resets).
    struct Stats {
        std::uint64_t chunksApplied{0};     // chunks whose rows reached the buffer
        std::uint64_t framesEmitted{0};
        std::uint64_t seqGaps{0};
        std::uint64_t droppedGeometry{0};   // width/height mismatch
        std::uint64_t droppedEmpty{0};      // numLines == 0
        std::uint64_t droppedOutOfRange{0}; // start row outside [0, H)
        std::uint64_t droppedTruncated{0};  // payload shorter than numLines*W
    };

    Reassembler();

    void setFrameReadyHandler(FrameReadyHandler cb) { onFrameReady_ = std::move(cb); }

    /// Apply one chunk. Never throws; bad input is a no-op.
    void apply(const Chunk& c);

    /// Forget the sequence baseline and the in-progress frame.
    void resetAll();

    /// Forget only the in-progress frame counters and row marks.
    void resetFrameState();

    int  linesWrittenThisFrame() const noexcept { return linesWrittenThisFrame_; }
    int  seqGapsThisFrame()      const noexcept { return seqGapsThisFrame_; }
    bool haveLastSeq()           const noexcept { return haveLastSeq_; }
    std::uint32_t lastSeq()      const noexcept { return lastSeq_; }

    /// Live buffer. Changes on the next apply(); copy it if you need to keep it.
    std::span<const std::uint8_t> frameBuffer() const noexcept { return frame_; }
    bool lineWritten(int row) const noexcept {
        return row >= 0 && row < H && lineWritten_[static_cast<std::size_t>(row)] != 0;
    }

    const Stats& stats() const noexcept { return stats_; }

private:
    std::vector<std::uint8_t> frame_;       // W*H, reused
    std::vector<std::uint8_t> lineWritten_; // H flags for the current cycle

    std::uint32_t lastSeq_{0};
    bool          haveLastSeq_{false};

    int linesWrittenThisFrame_{0};
    int seqGapsThisFrame_{0};

    Stats stats_{};
    FrameReadyHandler onFrameReady_;
};

} // namespace rvfstream
