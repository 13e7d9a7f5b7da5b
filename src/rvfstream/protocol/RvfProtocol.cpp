#include "rvfstream/protocol/RvfProtocol.hpp"

#include <algorithm>

namespace rvfstream {

namespace {
inline std::uint16_t rdU16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}
inline std::uint32_t rdU32(const std::uint8_t* p) {
    return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
           (std::uint32_t(p[2]) << 8)  |  std::uint32_t(p[3]);
}
inline void putU16(std::vector<std::uint8_t>& b, std::uint16_t v) {
    b.push_back(static_cast<std::uint8_t>(v >> 8));
    b.push_back(static_cast<std::uint8_t>(v & 0xFF));
}
inline void putU32(std::vector<std::uint8_t>& b, std::uint32_t v) {
    for (int s = 24; s >= 0; s -= 8) b.push_back(static_cast<std::uint8_t>((v >> s) & 0xFF));
}
} // namespace

bool hasMagic(std::span<const std::uint8_t> bytes) noexcept {
    return bytes.size() >= 4 &&
           bytes[0] == rvf::kMagic[0] && bytes[1] == rvf::kMagic[1] &&
           bytes[2] == rvf::kMagic[2] && bytes[3] == rvf::kMagic[3];
}

std::optional<std::size_t> findMagic(std::span<const std::uint8_t> bytes,
                                     std::size_t maxOffset) noexcept {
    if (bytes.size() < 4) return std::nullopt;
    const std::size_t last = std::min(bytes.size() - 4, maxOffset);
    for (std::size_t i = 0; i <= last; ++i) {
        if (hasMagic(bytes.subspan(i))) return i;
    }
    return std::nullopt;
}

std::optional<Chunk> parseChunk(std::span<const std::uint8_t> bytes) noexcept {
    if (bytes.size() < rvf::kHeaderSize || !hasMagic(bytes)) return std::nullopt;

    const std::uint8_t* p = bytes.data();
    if (p[4] != rvf::kVersion) return std::nullopt;

    Chunk c;
    c.width            = rdU16(p + 5);
    c.height           = rdU16(p + 7);
    c.lineNumber1Based = rdU16(p + 9);
    c.numLines         = p[11];
    c.endFrame         = p[12] != 0;
    c.frameId          = rdU32(p + 13);
    c.seq              = rdU32(p + 17);
    c.payload          = bytes.subspan(rvf::kHeaderSize);
    return c;
}

std::vector<std::uint8_t> encodeChunk(const Chunk& c) {
    std::vector<std::uint8_t> b;
    b.reserve(rvf::kHeaderSize + c.payload.size());

    b.insert(b.end(), std::begin(rvf::kMagic), std::end(rvf::kMagic));
    b.push_back(rvf::kVersion);
    putU16(b, c.width);
    putU16(b, c.height);
    putU16(b, c.lineNumber1Based);
    b.push_back(c.numLines);
    b.push_back(c.endFrame ? 1 : 0);
    putU32(b, c.frameId);
    putU32(b, c.seq);

    b.insert(b.end(), c.payload.begin(), c.payload.end());
    return b;
}

} // namespace rvfstream
