#include "rvfstream/core/Reassembler.hpp"
#include "rvfstream/io/UdpReceiver.hpp"
#include "rvfstream/io/UdpSender.hpp"
#include "rvfstream/protocol/Packetizer.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rvfstream;
using namespace std::chrono_literals;

namespace {

UdpReceiver::Options loopback_options() {
  UdpReceiver::Options o;
  o.port = 0;
  o.pollMs = 20;
  return o;
}

} // namespace

TEST(Udp, LoopbackFrameReassembled) {
  // declared before the receiver so they outlive its worker thread
  Reassembler r;
  std::mutex m;
  std::condition_variable cv;
  std::vector<std::uint8_t> got;
  FrameMeta meta{};
  std::atomic<int> ticks{0};

  UdpReceiver rx(loopback_options());
  ASSERT_NE(rx.boundPort(), 0);

  r.setFrameReadyHandler([&](std::vector<std::uint8_t> f, const FrameMeta &fm) {
    std::lock_guard<std::mutex> lk(m);
    got = std::move(f);
    meta = fm;
    cv.notify_all();
  });
  rx.start([&](const Chunk &c) { r.apply(c); },
           [&](std::chrono::steady_clock::time_point) { ++ticks; });

  std::vector<std::uint8_t> frame(rvf::kFrameBytes);
  for (std::size_t i = 0; i < frame.size(); ++i)
    frame[i] = static_cast<std::uint8_t>(i * 7);

  UdpSender tx("127.0.0.1", rx.boundPort());
  Packetizer p(4);
  for (const auto &dg : p.packetize(frame, 9)) {
    EXPECT_TRUE(tx.send(dg));
    std::this_thread::sleep_for(1ms);
  }

  {
    std::unique_lock<std::mutex> lk(m);
    ASSERT_TRUE(cv.wait_for(lk, 3s, [&] { return !got.empty(); }));
  }
  rx.shutdown();

  EXPECT_EQ(got, frame);
  EXPECT_EQ(meta.frameId, 9u);
  EXPECT_EQ(meta.linesWritten, 80);
  EXPECT_EQ(meta.seqGaps, 0);
  EXPECT_EQ(tx.sent(), 20u);
  EXPECT_GT(ticks.load(), 0);

  auto c = rx.counters();
  EXPECT_EQ(c.datagrams, 20u);
  EXPECT_EQ(c.chunks, 20u);
  EXPECT_EQ(c.nonRvf, 0u);
}

TEST(Udp, ForeignDatagramsCounted) {
  std::atomic<int> chunks{0};
  UdpReceiver rx(loopback_options());
  rx.start([&](const Chunk &) { ++chunks; });

  UdpSender tx("127.0.0.1", rx.boundPort());
  const std::vector<std::uint8_t> junk = {'h', 'e', 'l', 'l', 'o'};
  const std::vector<std::uint8_t> badVersion = {'R', 'V', 'F', 'U', 9, 0, 0, 0, 0, 0, 0,
                                                0,   0,   0,   0,   0, 0, 0, 0, 0, 0};
  EXPECT_TRUE(tx.send(junk));
  EXPECT_TRUE(tx.send(badVersion));

  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (rx.counters().datagrams < 2 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(5ms);
  rx.shutdown();

  auto c = rx.counters();
  EXPECT_EQ(c.datagrams, 2u);
  EXPECT_EQ(c.nonRvf, 1u);
  EXPECT_EQ(c.malformed, 1u);
  EXPECT_EQ(chunks.load(), 0);
}

TEST(Udp, SenderRejectsBadAddress) {
  EXPECT_THROW(UdpSender("not-an-ip", 50070), std::runtime_error);
}
