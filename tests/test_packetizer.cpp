#include "rvfstream/core/Reassembler.hpp"
#include "rvfstream/protocol/Packetizer.hpp"
#include <gtest/gtest.h>
#include <numeric>
#include <vector>

using namespace rvfstream;

static std::vector<std::uint8_t> ramp_frame(std::uint8_t base) {
  std::vector<std::uint8_t> f(rvf::kFrameBytes);
  for (std::size_t i = 0; i < f.size(); ++i)
    f[i] = static_cast<std::uint8_t>(base + i / rvf::kWidth);
  return f;
}

TEST(Packetizer, FourLinesGivesTwentyChunks) {
  Packetizer p(4);
  auto frame = ramp_frame(0);
  auto dgs = p.packetize(frame, 7);
  ASSERT_EQ(dgs.size(), 20u);

  for (std::size_t i = 0; i < dgs.size(); ++i) {
    auto c = parseChunk(dgs[i]);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->lineNumber1Based, 4 * i + 1);
    EXPECT_EQ(c->numLines, 4);
    EXPECT_EQ(c->frameId, 7u);
    EXPECT_EQ(c->seq, i);
    EXPECT_EQ(c->endFrame, i == 19);
    EXPECT_EQ(c->payload.size(), 4u * rvf::kWidth);
    EXPECT_EQ(dgs[i].size(), rvf::kHeaderSize + 4u * rvf::kWidth);
  }
  EXPECT_EQ(p.nextSeq(), 20u);
}

TEST(Packetizer, SeqContinuesAcrossFrames) {
  Packetizer p(4, 100);
  auto frame = ramp_frame(0);
  p.packetize(frame, 0);
  auto second = p.packetize(frame, 1);
  auto first = parseChunk(second.front());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->seq, 120u);
  EXPECT_EQ(first->frameId, 1u);
}

TEST(Packetizer, RemainderInLastChunk) {
  Packetizer p(7); // 11 chunks of 7 rows + 3
  auto dgs = p.packetize(ramp_frame(0), 0);
  ASSERT_EQ(dgs.size(), 12u);
  auto last = parseChunk(dgs.back());
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->lineNumber1Based, 78);
  EXPECT_EQ(last->numLines, 3);
  EXPECT_TRUE(last->endFrame);
}

TEST(Packetizer, ClampsLinesPerChunk) {
  EXPECT_EQ(Packetizer(0).linesPerChunk(), 1);
  EXPECT_EQ(Packetizer(1000).linesPerChunk(), 255);

  Packetizer whole(80);
  auto dgs = whole.packetize(ramp_frame(0), 0);
  ASSERT_EQ(dgs.size(), 1u);
  EXPECT_TRUE(parseChunk(dgs[0])->endFrame);
}

TEST(Packetizer, RejectsWrongSize) {
  Packetizer p;
  std::vector<std::uint8_t> small(100);
  EXPECT_TRUE(p.packetize(small, 0).empty());
  EXPECT_EQ(p.nextSeq(), 0u);
}

TEST(Packetizer, ReassemblesToSameFrame) {
  Packetizer p(4);
  Reassembler r;
  std::vector<std::vector<std::uint8_t>> frames;
  std::vector<FrameMeta> metas;
  r.setFrameReadyHandler([&](std::vector<std::uint8_t> f, const FrameMeta &m) {
    frames.push_back(std::move(f));
    metas.push_back(m);
  });

  const auto a = ramp_frame(1);
  const auto b = ramp_frame(50);
  for (const auto &dg : p.packetize(a, 0))
    r.apply(*parseChunk(dg));
  for (const auto &dg : p.packetize(b, 1))
    r.apply(*parseChunk(dg));

  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0], a);
  EXPECT_EQ(frames[1], b);
  EXPECT_EQ(metas[1].frameId, 1u);
  EXPECT_EQ(metas[1].linesWritten, 80);
  EXPECT_EQ(metas[1].seqGaps, 0);
}

TEST(Packetizer, LostChunkShowsUpAsGapAndShortFrame) {
  Packetizer p(4);
  Reassembler r;
  FrameMeta meta{};
  int n = 0;
  r.setFrameReadyHandler([&](std::vector<std::uint8_t>, const FrameMeta &m) {
    meta = m;
    ++n;
  });

  auto dgs = p.packetize(ramp_frame(0), 3);
  dgs.erase(dgs.begin() + 5);
  for (const auto &dg : dgs)
    r.apply(*parseChunk(dg));

  ASSERT_EQ(n, 1);
  EXPECT_EQ(meta.linesWritten, 76);
  EXPECT_EQ(meta.seqGaps, 1);
}
