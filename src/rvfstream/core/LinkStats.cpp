#include "rvfstream/core/LinkStats.hpp"

namespace rvfstream {

LinkStats::LinkStats(int expectedLines) : expectedLines_(expectedLines) {}

void LinkStats::account(const FrameMeta& m) {
    ++framesIn_;

    const bool incomplete = m.linesWritten != expectedLines_;
    const bool gap        = m.seqGaps > 0;

    if (incomplete) ++incomplete_;
    if (gap) {
        ++gapFrames_;
        sumGaps_ += static_cast<std::uint64_t>(m.seqGaps);
    }
    if (incomplete || gap) ++dropped_;
}

LinkStats::Snapshot LinkStats::snapshot() const {
    Snapshot s;
    s.framesIn   = framesIn_.load();
    s.incomplete = incomplete_.load();
    s.gapFrames  = gapFrames_.load();
    s.sumGaps    = sumGaps_.load();
    s.dropped    = dropped_.load();
    return s;
}

void LinkStats::reset() {
    framesIn_ = 0; incomplete_ = 0; gapFrames_ = 0; sumGaps_ = 0; dropped_ = 0;
}

//---------------- LinkMonitor ----------------

LinkMonitor::LinkMonitor(std::chrono::milliseconds timeout, std::chrono::milliseconds suppress)
    : timeout_(timeout), suppress_(suppress) {}

void LinkMonitor::onFrame(Clock::time_point now) {
    hasFrame_  = true;
    lastFrame_ = now;
}

bool LinkMonitor::checkSignalLost(Clock::time_point now) {
    if (!hasFrame_) return false;
    if (now - lastFrame_ <= timeout_) return false;

    hasFrame_      = false;
    lastFrame_     = Clock::time_point{};
    suppressUntil_ = now + suppress_;
    ++losses_;
    return true;
}

} // namespace rvfstream
