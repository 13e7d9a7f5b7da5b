//====================================================================
// File: core/include/rvfstream/core/Frame.hpp
//====================================================================
#pragma once


#include <span>
#include <cstdint>
#include <chrono>


namespace rvfstream {


/// Metadata attached to every completed frame.
struct FrameMeta {
std::uint32_t frameId{0};  ///< producer frame id of the end-of-frame chunk
std::uint32_t seq{0};      ///< global chunk counter of the end-of-frame chunk
int linesWritten{0};       ///< distinct rows written during this frame cycle
int seqGaps{0};            ///< sequence discontinuities seen during this cycle
};


/// Lightweight view of a single Gray8 frame.
struct Frame {
std::span<const std::uint8_t> data{}; ///< read-only pixel buffer, 1 byte per pixel
std::uint32_t width{0};
std::uint32_t height{0};
std::chrono::steady_clock::time_point timestamp{};


/// Total byte size expected for width x height.
[[nodiscard]] std::size_t bytes() const noexcept {
return static_cast<std::size_t>(width) * height;
}
};


} // namespace rvfstream
