#include "rvfstream/io/Recorder.hpp"

#include <zlib.h>

#include <chrono>
#include <cstring>

namespace rvfstream {

namespace {
#pragma pack(push, 1)
struct FileHeader {
    char     magic[4];   // 'R','V','R','1'
    uint32_t version;    // 1
};
struct RecordHeader {
    uint32_t width;         // 4
    uint32_t height;        // 4
    uint32_t frame_id;      // 4
    uint32_t seq;           // 4
    int32_t  lines_written; // 4
    int32_t  seq_gaps;      // 4
    uint64_t timestamp_ns;  // 8
    uint32_t crc32;         // 4
    uint32_t data_size;     // 4
}; // 40 bytes with pack(1)
#pragma pack(pop)

static_assert(sizeof(FileHeader)   == 8,  "FileHeader size unexpected");
static_assert(sizeof(RecordHeader) == 40, "RecordHeader size unexpected");

// Records larger than this are treated as corruption.
constexpr std::uint32_t kMaxRecordBytes = 64u << 20;

std::uint32_t crc32_bytes(const void* data, std::size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    return static_cast<std::uint32_t>(crc);
}

} // namespace

//---------------- FrameRecorder ----------------

FrameRecorder::FrameRecorder(const std::string& path)
    : ofs_(path, std::ios::binary)
{
    if (!ofs_) return;

    FileHeader h{};
    std::memcpy(h.magic, "RVR1", 4);
    h.version = 1u;
    ofs_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    ok_ = static_cast<bool>(ofs_);
}

FrameRecorder::~FrameRecorder() = default;

bool FrameRecorder::write(const Frame& f, const FrameMeta& meta)
{
    if (!ok_) return false;
    if (f.data.size() < f.bytes()) return false;

    RecordHeader rh{};
    rh.width         = f.width;
    rh.height        = f.height;
    rh.frame_id      = meta.frameId;
    rh.seq           = meta.seq;
    rh.lines_written = meta.linesWritten;
    rh.seq_gaps      = meta.seqGaps;
    rh.timestamp_ns  = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                         f.timestamp.time_since_epoch()).count());
    rh.data_size     = static_cast<std::uint32_t>(f.bytes());
    rh.crc32         = crc32_bytes(f.data.data(), rh.data_size);

    ofs_.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
    if (!ofs_) return false;

    if (rh.data_size) {
        ofs_.write(reinterpret_cast<const char*>(f.data.data()), rh.data_size);
        if (!ofs_) return false;
    }
    ofs_.flush();
    ++frames_;
    return true;
}

//---------------- FramePlayer ----------------

FramePlayer::FramePlayer(const std::string& path)
    : ifs_(path, std::ios::binary)
{
    if (!ifs_) return;
    FileHeader h{};
    ifs_.read(reinterpret_cast<char*>(&h), sizeof(h));
    if (!ifs_) return;
    if (std::memcmp(h.magic, "RVR1", 4) != 0 || h.version != 1u) {
        return;
    }
    ok_ = true;
}

FramePlayer::~FramePlayer() = default;

bool FramePlayer::readNext(Frame& out, std::vector<std::uint8_t>& scratch,
                           FrameMeta* out_meta,
                           std::uint64_t* out_ts_ns,
                           bool* out_crc_ok)
{
    if (!ok_) return false;

    RecordHeader rh{};
    ifs_.read(reinterpret_cast<char*>(&rh), sizeof(rh));
    if (!ifs_) return false;
    if (rh.data_size > kMaxRecordBytes) return false;

    scratch.resize(rh.data_size);
    if (rh.data_size) {
        ifs_.read(reinterpret_cast<char*>(scratch.data()), rh.data_size);
        if (!ifs_) return false;
    }

    if (out_meta) {
        out_meta->frameId      = rh.frame_id;
        out_meta->seq          = rh.seq;
        out_meta->linesWritten = rh.lines_written;
        out_meta->seqGaps      = rh.seq_gaps;
    }
    if (out_ts_ns)  *out_ts_ns  = rh.timestamp_ns;
    if (out_crc_ok) *out_crc_ok = crc32_bytes(scratch.data(), scratch.size()) == rh.crc32;

    out.width     = rh.width;
    out.height    = rh.height;
    out.timestamp = std::chrono::steady_clock::time_point{}; // the player sets its own pace
    out.data      = std::span<const std::uint8_t>(scratch.data(), scratch.size());

    return true;
}

} // namespace rvfstream
