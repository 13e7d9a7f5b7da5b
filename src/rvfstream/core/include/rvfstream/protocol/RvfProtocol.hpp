#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace rvfstream {

// RVF wire format (all multi-byte fields big-endian):
//
//   off  size  field
//    0    4    magic "RVFU"
//    4    1    version (1)
//    5    2    width   (320)
//    7    2    height  (80)
//    9    2    line number of the first row, 1-based
//   11    1    number of rows carried
//   12    1    end-of-frame flag (0/1)
//   13    4    frame id
//   17    4    seq (one per chunk, never resets at frame boundaries)
//   21   n*W   payload, rows top to bottom
namespace rvf {

inline constexpr std::uint8_t  kMagic[4]    = {'R', 'V', 'F', 'U'};
inline constexpr std::size_t   kHeaderSize  = 21;
inline constexpr std::uint16_t kWidth       = 320;
inline constexpr std::uint16_t kHeight      = 80;
inline constexpr std::size_t   kFrameBytes  = std::size_t(kWidth) * kHeight;
inline constexpr std::uint8_t  kVersion     = 1;
inline constexpr std::uint16_t kDefaultPort = 50070;

// How far into a datagram findMagic() looks for the marker.
inline constexpr std::size_t   kMagicSearchWindow = 64;

} // namespace rvf

/// One transport chunk. The payload is a view into the buffer it was
/// parsed from (or built from); the owner of that buffer keeps it alive.
struct Chunk {
    std::uint16_t width{0};
    std::uint16_t height{0};
    std::uint16_t lineNumber1Based{0};
    std::uint8_t  numLines{0};
    bool          endFrame{false};
    std::uint32_t frameId{0};
    std::uint32_t seq{0};
    std::span<const std::uint8_t> payload{};
};

/// True iff the buffer starts with "RVFU". Checks nothing else.
[[nodiscard]] bool hasMagic(std::span<const std::uint8_t> bytes) noexcept;

/// Offset of "RVFU" within the first kMagicSearchWindow bytes, if any.
/// Tolerates senders that pad the datagram before the header.
[[nodiscard]] std::optional<std::size_t>
findMagic(std::span<const std::uint8_t> bytes,
          std::size_t maxOffset = rvf::kMagicSearchWindow) noexcept;

/// Decode a chunk starting at bytes[0]. Empty on missing magic, short
/// header or unknown version. Geometry is left to the Reassembler.
[[nodiscard]] std::optional<Chunk> parseChunk(std::span<const std::uint8_t> bytes) noexcept;

/// Serialize header + payload.
std::vector<std::uint8_t> encodeChunk(const Chunk& c);

} // namespace rvfstream
