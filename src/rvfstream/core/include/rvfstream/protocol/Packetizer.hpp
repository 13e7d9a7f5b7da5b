#pragma once
#include "rvfstream/protocol/RvfProtocol.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace rvfstream {

/* Slices 320x80 Gray8 frames into encoded RVF datagrams.

   - linesPerChunk rows per datagram (4 -> 20 datagrams, lines 1,5,...,77);
     if it does not divide the height the last datagram carries the rest;
   - the last datagram of a frame has the end-of-frame flag;
   - seq is one counter for the whole stream, it continues across frames. */
class Packetizer {
public:
    explicit Packetizer(int linesPerChunk = 4, std::uint32_t firstSeq = 0);

    /// Encoded datagrams for one frame. Empty if frame is not W*H bytes.
    std::vector<std::vector<std::uint8_t>> packetize(std::span<const std::uint8_t> frame,
                                                     std::uint32_t frameId);

    int linesPerChunk() const { return linesPerChunk_; }
    std::uint32_t nextSeq() const { return seq_; }

private:
    int linesPerChunk_;
    std::uint32_t seq_;
};

} // namespace rvfstream
