#include "rvfstream/io/GrpcClient.hpp"
#include "rvfstream/io/GrpcServer.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace rvfstream;
using namespace std::chrono_literals;

TEST(Relay, FramesReachViewerWithMetadata) {
  std::mutex m;
  std::vector<std::uint8_t> got;
  FrameMeta gotMeta{};
  std::atomic<int> received{0};

  GrpcServer server(0);
  ASSERT_NE(server.boundPort(), 0);

  GrpcClient::Options co;
  co.reconnectInitialMs = 50;
  co.reconnectMaxMs = 200;
  co.printHeartbeat = false;
  GrpcClient client("127.0.0.1:" + std::to_string(server.boundPort()), co);
  client.start([&](const Frame &f, const FrameMeta &meta) {
    std::lock_guard<std::mutex> lk(m);
    got.assign(f.data.begin(), f.data.end());
    gotMeta = meta;
    ++received;
  });

  std::vector<std::uint8_t> pixels(rvf::kFrameBytes);
  for (std::size_t i = 0; i < pixels.size(); ++i)
    pixels[i] = static_cast<std::uint8_t>(i % 251);
  const Frame frame{pixels, rvf::kWidth, rvf::kHeight, std::chrono::steady_clock::now()};
  const FrameMeta meta{77, 1539, 76, 1};

  // the viewer may connect after the first pushes; keep feeding until one lands
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (received == 0 && std::chrono::steady_clock::now() < deadline) {
    server.pushFrame(frame, meta);
    std::this_thread::sleep_for(50ms);
  }
  client.shutdown();

  ASSERT_GT(received.load(), 0);
  std::lock_guard<std::mutex> lk(m);
  EXPECT_EQ(got, pixels);
  EXPECT_EQ(gotMeta.frameId, 77u);
  EXPECT_EQ(gotMeta.seq, 1539u);
  EXPECT_EQ(gotMeta.linesWritten, 76);
  EXPECT_EQ(gotMeta.seqGaps, 1);
  EXPECT_EQ(client.crcErrors(), 0u);
}

// Push ids 0..6 into a queue of 4 with no viewer, then connect one and collect
// whatever was kept.
static std::vector<std::uint32_t> relayQueueSurvivors(bool dropOldest, std::uint64_t &drops) {
  GrpcServer::Options so;
  so.maxQueue = 4;
  so.dropOldest = dropOldest;
  so.heartbeatMs = 50;
  GrpcServer server(0, so);

  std::vector<std::uint8_t> pixels(rvf::kFrameBytes, 0x5A);
  const Frame frame{pixels, rvf::kWidth, rvf::kHeight, std::chrono::steady_clock::now()};
  for (std::uint32_t id = 0; id < 7; ++id)
    server.pushFrame(frame, FrameMeta{id, id * 20, 80, 0});
  drops = server.queueDrops();

  std::mutex m;
  std::vector<std::uint32_t> ids;
  GrpcClient::Options co;
  co.reconnectInitialMs = 50;
  co.reconnectMaxMs = 200;
  co.printHeartbeat = false;
  GrpcClient client("127.0.0.1:" + std::to_string(server.boundPort()), co);
  client.start([&](const Frame &, const FrameMeta &meta) {
    std::lock_guard<std::mutex> lk(m);
    ids.push_back(meta.frameId);
  });

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard<std::mutex> lk(m);
      if (ids.size() >= 4) break;
    }
    std::this_thread::sleep_for(20ms);
  }
  client.shutdown();
  std::lock_guard<std::mutex> lk(m);
  return ids;
}

TEST(Relay, FullQueueEvictsOldestWithoutViewer) {
  std::uint64_t drops = 0;
  const auto ids = relayQueueSurvivors(true, drops);
  EXPECT_EQ(drops, 3u);
  EXPECT_EQ(ids, (std::vector<std::uint32_t>{3, 4, 5, 6}));
}

TEST(Relay, FullQueueRejectsNewestWhenConfigured) {
  std::uint64_t drops = 0;
  const auto ids = relayQueueSurvivors(false, drops);
  EXPECT_EQ(drops, 3u);
  EXPECT_EQ(ids, (std::vector<std::uint32_t>{0, 1, 2, 3}));
}

TEST(Relay, HeartbeatsNeverReachHandler) {
  GrpcServer::Options so;
  so.heartbeatMs = 20;
  GrpcServer server(0, so);

  std::atomic<int> calls{0};
  GrpcClient::Options co;
  co.reconnectInitialMs = 50;
  co.reconnectMaxMs = 200;
  co.printHeartbeat = false;
  GrpcClient client("127.0.0.1:" + std::to_string(server.boundPort()), co);
  client.start([&](const Frame &, const FrameMeta &) { ++calls; });

  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (client.heartbeats() < 5 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(20ms);
  client.shutdown();

  EXPECT_GE(client.heartbeats(), 5u);
  EXPECT_EQ(calls.load(), 0);
  EXPECT_EQ(client.crcErrors(), 0u);
  EXPECT_EQ(server.queueDrops(), 0u);
}
