#include "rvfstream/core/LinkStats.hpp"
#include <gtest/gtest.h>

using namespace rvfstream;
using namespace std::chrono_literals;

TEST(LinkStats, ClassifiesFrames) {
  LinkStats s(80);
  s.account({1, 19, 80, 0}); // clean
  s.account({2, 39, 76, 0}); // incomplete
  s.account({3, 59, 80, 2}); // gaps
  s.account({4, 79, 40, 1}); // both

  auto snap = s.snapshot();
  EXPECT_EQ(snap.framesIn, 4u);
  EXPECT_EQ(snap.incomplete, 2u);
  EXPECT_EQ(snap.gapFrames, 2u);
  EXPECT_EQ(snap.sumGaps, 3u);
  EXPECT_EQ(snap.dropped, 3u);

  s.reset();
  EXPECT_EQ(s.snapshot().framesIn, 0u);
  EXPECT_EQ(s.snapshot().dropped, 0u);
}

TEST(LinkMonitor, NoLossBeforeFirstFrame) {
  LinkMonitor m(100ms, 50ms);
  auto t = LinkMonitor::Clock::now();
  EXPECT_FALSE(m.checkSignalLost(t + 10s));
  EXPECT_FALSE(m.hasFrame());
  EXPECT_FALSE(m.suppressed(t));
}

TEST(LinkMonitor, LossFiresOnceAndSuppresses) {
  LinkMonitor m(100ms, 50ms);
  auto t = LinkMonitor::Clock::now();
  m.onFrame(t);
  EXPECT_TRUE(m.hasFrame());
  EXPECT_FALSE(m.checkSignalLost(t + 100ms));

  EXPECT_TRUE(m.checkSignalLost(t + 101ms));
  EXPECT_FALSE(m.hasFrame());
  EXPECT_EQ(m.losses(), 1u);
  EXPECT_FALSE(m.checkSignalLost(t + 500ms));

  EXPECT_TRUE(m.suppressed(t + 120ms));
  EXPECT_FALSE(m.suppressed(t + 151ms));
}

TEST(LinkMonitor, FramesKeepLinkAlive) {
  LinkMonitor m(100ms, 50ms);
  auto t = LinkMonitor::Clock::now();
  for (int i = 0; i < 10; ++i) {
    m.onFrame(t + i * 80ms);
    EXPECT_FALSE(m.checkSignalLost(t + i * 80ms + 90ms));
  }
  EXPECT_EQ(m.losses(), 0u);
}
