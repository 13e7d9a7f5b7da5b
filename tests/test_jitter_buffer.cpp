#include "jitter_buffer.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <vector>

using namespace rvfstream;

namespace {

RecvFrame make_recv(std::uint32_t id) {
  RecvFrame rf;
  rf.buf.assign(16, static_cast<std::uint8_t>(id));
  rf.width = 4;
  rf.height = 4;
  rf.meta.frameId = id;
  return rf;
}

std::vector<std::uint32_t> drain(JitterBuffer &jb) {
  std::vector<std::uint32_t> ids;
  RecvFrame rf;
  while (jb.pop_wait(rf, 0)) ids.push_back(rf.meta.frameId);
  return ids;
}

} // namespace

TEST(JitterBuffer, OldestPolicyEvictsFront) {
  JitterBuffer jb(2, DropPolicy::Oldest);
  std::atomic<std::uint64_t> drops{0};
  for (std::uint32_t id = 1; id <= 3; ++id) jb.push(make_recv(id), drops);

  EXPECT_EQ(drops.load(), 1u);
  EXPECT_EQ(jb.size(), 2u);
  EXPECT_EQ(drain(jb), (std::vector<std::uint32_t>{2, 3}));
}

TEST(JitterBuffer, NewestPolicyRejectsIncoming) {
  JitterBuffer jb(2, DropPolicy::Newest);
  std::atomic<std::uint64_t> drops{0};
  for (std::uint32_t id = 1; id <= 3; ++id) jb.push(make_recv(id), drops);

  EXPECT_EQ(drops.load(), 1u);
  EXPECT_EQ(jb.size(), 2u);
  EXPECT_EQ(drain(jb), (std::vector<std::uint32_t>{1, 2}));
}

TEST(JitterBuffer, PopTimesOutWhenEmpty) {
  JitterBuffer jb(2, DropPolicy::Oldest);
  RecvFrame rf;
  EXPECT_FALSE(jb.pop_wait(rf, 10));
}

TEST(JitterBuffer, PoppedFrameKeepsPixels) {
  JitterBuffer jb(1, DropPolicy::Oldest);
  std::atomic<std::uint64_t> drops{0};
  jb.push(make_recv(9), drops);
  RecvFrame rf;
  ASSERT_TRUE(jb.pop_wait(rf, 10));
  const Frame f = rf.view();
  EXPECT_EQ(f.bytes(), 16u);
  ASSERT_EQ(f.data.size(), 16u);
  EXPECT_EQ(f.data[0], 9);
  EXPECT_EQ(drops.load(), 0u);
}
