#include "rvfstream/protocol/Packetizer.hpp"

#include <algorithm>

namespace rvfstream {

Packetizer::Packetizer(int linesPerChunk, std::uint32_t firstSeq)
    : linesPerChunk_(std::clamp(linesPerChunk, 1, 255))
    , seq_(firstSeq) {}

std::vector<std::vector<std::uint8_t>>
Packetizer::packetize(std::span<const std::uint8_t> frame, std::uint32_t frameId) {
    std::vector<std::vector<std::uint8_t>> out;
    if (frame.size() != rvf::kFrameBytes) return out;

    const int H = rvf::kHeight;
    const int W = rvf::kWidth;
    out.reserve(static_cast<std::size_t>((H + linesPerChunk_ - 1) / linesPerChunk_));

    for (int row = 0; row < H; row += linesPerChunk_) {
        const int n = std::min(linesPerChunk_, H - row);

        Chunk c;
        c.width            = rvf::kWidth;
        c.height           = rvf::kHeight;
        c.lineNumber1Based = static_cast<std::uint16_t>(row + 1);
        c.numLines         = static_cast<std::uint8_t>(n);
        c.endFrame         = (row + n) >= H;
        c.frameId          = frameId;
        c.seq              = seq_++;
        c.payload          = frame.subspan(static_cast<std::size_t>(row) * W,
                                           static_cast<std::size_t>(n) * W);

        out.push_back(encodeChunk(c));
    }
    return out;
}

} // namespace rvfstream
