#pragma once

#include "rvfstream/core/Frame.hpp"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace rvfstream {

// Capture file RVR1, one record per completed frame:
//
// Header:
//   char     magic[4] = 'R','V','R','1'
//   uint32_t version  = 1
//
// Record:
//   uint32_t width
//   uint32_t height
//   uint32_t frame_id
//   uint32_t seq
//   int32_t  lines_written
//   int32_t  seq_gaps
//   uint64_t timestamp_ns
//   uint32_t crc32        (zlib, over data)
//   uint32_t data_size
//   uint8_t  data[data_size]
//
// Little-endian, host layout.

class FrameRecorder {
public:
    explicit FrameRecorder(const std::string& path);
    ~FrameRecorder();

    bool ok() const { return ok_; }

    bool write(const Frame& f, const FrameMeta& meta);

    std::uint64_t frames() const { return frames_; }

private:
    std::ofstream ofs_;
    bool ok_{false};
    std::uint64_t frames_{0};
};

class FramePlayer {
public:
    explicit FramePlayer(const std::string& path);
    ~FramePlayer();

    bool ok() const { return ok_; }

    // Read the next record. 'out' points into 'scratch'.
    // Returns false at end of file, on a truncated record or a bad header.
    // 'out_crc_ok' tells whether the stored CRC matches the pixels.
    bool readNext(Frame& out, std::vector<std::uint8_t>& scratch,
                  FrameMeta* out_meta = nullptr,
                  std::uint64_t* out_ts_ns = nullptr,
                  bool* out_crc_ok = nullptr);

private:
    std::ifstream ifs_;
    bool ok_{false};
};

} // namespace rvfstream
