#include "utils.hpp"
#include "rvfstream/io/Recorder.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <thread>
#include <vector>

using namespace rvfstream;
using namespace std::chrono_literals;

namespace {

std::filesystem::path temp_path(const std::string &name) {
  const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
  return std::filesystem::temp_directory_path() /
         (std::string("rvfstream_") + info->name() + "_" + name);
}

} // namespace

TEST(ExportCapture, MalformedRecordIsSkipped) {
  const auto cap = temp_path("cap.rvr");
  const auto dir = temp_path("png");
  std::filesystem::remove_all(dir);

  std::vector<std::uint8_t> good(rvf::kFrameBytes, 40);
  {
    FrameRecorder rec(cap.string());
    ASSERT_TRUE(rec.ok());
    ASSERT_TRUE(rec.write(Frame{good, rvf::kWidth, rvf::kHeight, {}}, {1, 19, 80, 0}));
    // zero width: 0 x 80 pixels, no payload
    ASSERT_TRUE(rec.write(Frame{good, 0, rvf::kHeight, {}}, {2, 39, 80, 0}));
    ASSERT_TRUE(rec.write(Frame{good, rvf::kWidth, rvf::kHeight, {}}, {3, 59, 80, 0}));
  }

  FramePlayer player(cap.string());
  ASSERT_TRUE(player.ok());
  ExportSummary sum;
  EXPECT_TRUE(export_capture_png(player, dir.string(), sum));
  EXPECT_EQ(sum.frames, 2u);
  EXPECT_EQ(sum.badRecords, 1u);
  EXPECT_EQ(sum.crcErrors, 0u);
  EXPECT_TRUE(std::filesystem::exists(dir / "frame_000000_id1.png"));
  EXPECT_FALSE(std::filesystem::exists(dir / "frame_000001_id2.png"));
  EXPECT_TRUE(std::filesystem::exists(dir / "frame_000002_id3.png"));

  std::filesystem::remove_all(dir);
  std::filesystem::remove(cap);
}

TEST(WaitUntilStopped, HeadlessWaitsForEnter) {
  std::atomic<bool> running{true};
  std::istringstream in("\n");
  wait_until_stopped(running, 0, false, in, "test");
  EXPECT_FALSE(running.load());
  EXPECT_TRUE(in.eof() || in.peek() == std::char_traits<char>::eof());
}

TEST(WaitUntilStopped, DurationEndsRun) {
  std::atomic<bool> running{true};
  std::istringstream in;
  const auto t0 = std::chrono::steady_clock::now();
  wait_until_stopped(running, 1, false, in, "test");
  EXPECT_GE(std::chrono::steady_clock::now() - t0, 900ms);
  EXPECT_FALSE(running.load());
}

TEST(WaitUntilStopped, ViewerUpWaitsForViewerToStop) {
  std::atomic<bool> running{true};
  std::istringstream in("\n");
  std::thread viewer([&] {
    std::this_thread::sleep_for(100ms);
    running = false;
  });
  wait_until_stopped(running, 0, true, in, "test");
  viewer.join();
  EXPECT_FALSE(running.load());
  // the console was left alone
  EXPECT_EQ(in.peek(), '\n');
}
