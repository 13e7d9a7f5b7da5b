#include "rvfstream/io/PatternSource.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace rvfstream;

TEST(PatternSource, GradientMovesPerFrame) {
  PatternSource src;
  auto f0 = src.next();
  ASSERT_TRUE(f0.has_value());
  EXPECT_EQ(f0->width, 320u);
  EXPECT_EQ(f0->height, 80u);
  ASSERT_EQ(f0->data.size(), rvf::kFrameBytes);
  EXPECT_EQ(f0->data[0], 0);
  EXPECT_EQ(f0->data[5], 5);
  EXPECT_EQ(f0->data[2 * rvf::kWidth], 8); // 4 per row

  auto f1 = src.next();
  ASSERT_TRUE(f1.has_value());
  EXPECT_EQ(f1->data[0], 3);
  EXPECT_EQ(src.produced(), 2u);
}

TEST(PatternSource, StaticPatternsRepeat) {
  for (const char *name : {"grid", "checker", "text:RVF"}) {
    PatternSource::Options o;
    o.pattern = name;
    PatternSource src(o);
    auto a = src.next();
    ASSERT_TRUE(a.has_value());
    const std::vector<std::uint8_t> first(a->data.begin(), a->data.end());
    auto b = src.next();
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(std::equal(first.begin(), first.end(), b->data.begin())) << name;
  }
}

TEST(PatternSource, NoiseIsSeeded) {
  PatternSource::Options o;
  o.pattern = "noise";
  o.seed = 42;
  PatternSource a(o), b(o);
  auto fa = a.next();
  auto fb = b.next();
  ASSERT_TRUE(fa && fb);
  EXPECT_TRUE(std::equal(fa->data.begin(), fa->data.end(), fb->data.begin()));
}

TEST(PatternSource, MissingImageThrows) {
  PatternSource::Options o;
  o.imagePath = "/nonexistent/image.png";
  EXPECT_THROW(PatternSource src(o), std::runtime_error);
}

TEST(PatternSource, UnknownPatternThrows) {
  PatternSource::Options o;
  o.pattern = "gird";
  EXPECT_THROW(PatternSource src(o), std::runtime_error);
  o.pattern = "text";
  EXPECT_THROW(PatternSource src(o), std::runtime_error);
}
