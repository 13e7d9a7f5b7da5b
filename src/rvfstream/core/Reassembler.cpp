#include "rvfstream/core/Reassembler.hpp"

#include <algorithm>
#include <cstring>

namespace rvfstream {

Reassembler::Reassembler()
    : frame_(static_cast<std::size_t>(W) * H, 0)
    , lineWritten_(static_cast<std::size_t>(H), 0) {}

void Reassembler::resetAll() {
    haveLastSeq_ = false;
    lastSeq_ = 0;
    resetFrameState();
}

void Reassembler::resetFrameState() {
    std::fill(lineWritten_.begin(), lineWritten_.end(), std::uint8_t{0});
    linesWrittenThisFrame_ = 0;
    seqGapsThisFrame_ = 0;
}

void Reassembler::apply(const Chunk& c) {
    if (c.width != W || c.height != H) { ++stats_.droppedGeometry; return; }
    if (c.numLines == 0)               { ++stats_.droppedEmpty;    return; }

    // seq is global across frames; any jump counts once against the current frame
    if (haveLastSeq_ && c.seq != static_cast<std::uint32_t>(lastSeq_ + 1u)) {
        ++seqGapsThisFrame_;
        ++stats_.seqGaps;
    }
    lastSeq_ = c.seq;
    haveLastSeq_ = true;

    const int startRow = static_cast<int>(c.lineNumber1Based) - 1;
    if (startRow < 0 || startRow >= H) { ++stats_.droppedOutOfRange; return; }

    const int lines = c.numLines;
    if (c.payload.size() < static_cast<std::size_t>(lines) * W) { ++stats_.droppedTruncated; return; }

    for (int l = 0; l < lines; ++l) {
        const int y = startRow + l;
        if (y >= H) continue;

        std::memcpy(frame_.data() + static_cast<std::size_t>(y) * W,
                    c.payload.data() + static_cast<std::size_t>(l) * W,
                    W);

        auto& mark = lineWritten_[static_cast<std::size_t>(y)];
        if (!mark) {
            mark = 1;
            ++linesWrittenThisFrame_;
        }
    }
    ++stats_.chunksApplied;

    if (c.endFrame) {
        // hand out a copy so the consumer can hold it while we fill the next frame
        std::vector<std::uint8_t> out(frame_);

        FrameMeta meta;
        meta.frameId      = c.frameId;
        meta.seq          = c.seq;
        meta.linesWritten = linesWrittenThisFrame_;
        meta.seqGaps      = seqGapsThisFrame_;

        ++stats_.framesEmitted;
        if (onFrameReady_) onFrameReady_(std::move(out), meta);

        resetFrameState();
    }
}

} // namespace rvfstream
