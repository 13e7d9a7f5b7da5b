#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"
#include "mist.hpp"
#include "jitter_buffer.hpp"

#include "rvfstream/core/Config.hpp"
#include "rvfstream/core/LinkStats.hpp"
#include "rvfstream/core/Reassembler.hpp"
#include "rvfstream/io/GrpcServer.hpp"
#include "rvfstream/io/Recorder.hpp"
#include "rvfstream/io/UdpReceiver.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <memory>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <cmath>

#ifndef RVFSTREAM_VERSION
#define RVFSTREAM_VERSION "dev"
#endif
#ifndef RVFSTREAM_GIT_SHA
#define RVFSTREAM_GIT_SHA "unknown"
#endif

namespace {

const char* drop_name(rvfstream::DropPolicy d) {
    return d == rvfstream::DropPolicy::Oldest ? "oldest" : "newest";
}

} // namespace

int run_receive(int argc, char** argv) {
    using namespace std::chrono;

    const std::string net = argValue(argc, argv, "net", "balanced");

    // 1) network profile -> defaults
    rvfstream::Config cfg{};
    if (net == "fast") {
        cfg.queueCapacity = 8;   cfg.pollMs = 50;  cfg.signalLostMs = 1000; cfg.suppressAfterLossMs = 500;
    } else if (net == "robust") {
        cfg.queueCapacity = 256; cfg.pollMs = 100; cfg.signalLostMs = 4000; cfg.suppressAfterLossMs = 1500;
    } else { // balanced
        cfg.queueCapacity = 64;  cfg.pollMs = 100; cfg.signalLostMs = 2000; cfg.suppressAfterLossMs = 1000;
    }

    // 2) explicit options override the profile
    cfg.port                = static_cast<std::uint16_t>(argValueInt(argc, argv, "port", cfg.port));
    cfg.recvBufferBytes     = std::max(64 * 1024, argValueInt(argc, argv, "rcvbuf", cfg.recvBufferBytes));
    cfg.queueCapacity       = static_cast<std::size_t>(std::max(1, argValueInt(argc, argv, "bufcap", static_cast<int>(cfg.queueCapacity))));
    cfg.drop                = argValue(argc, argv, "drop", "oldest") == "newest" ? rvfstream::DropPolicy::Newest
                                                                                 : rvfstream::DropPolicy::Oldest;
    cfg.signalLostMs        = std::max(100, argValueInt(argc, argv, "signal-lost", cfg.signalLostMs));
    cfg.suppressAfterLossMs = std::max(0, argValueInt(argc, argv, "suppress", cfg.suppressAfterLossMs));
    cfg.healthMs            = std::max(250, argValueInt(argc, argv, "health", cfg.healthMs));
    cfg.relayPort           = argValueInt(argc, argv, "relay", cfg.relayPort);

    const std::string recordPath = argValue(argc, argv, "record", "");
    const std::string saveName   = argValue(argc, argv, "save", "last_frame.png");
    const int durationSec        = std::max(0, argValueInt(argc, argv, "duration", 0));
    const bool withView          = argHas(argc, argv, "view");
    const bool verbose           = argHas(argc, argv, "verbose");
    const std::string outdir     = argValue(argc, argv, "outdir", mist::default_outdir("receive"));

    const std::string runId   = mist::rand_id();
    const std::string started = mist::iso_utc_now();

    std::cout << "[receive] starting…\n";
    std::cout << "[receive] net=" << net << ", port=" << cfg.port
              << ", bufcap=" << cfg.queueCapacity << ", drop=" << drop_name(cfg.drop)
              << ", signal_lost=" << cfg.signalLostMs << "ms"
              << (recordPath.empty() ? "" : ", record=" + recordPath)
              << (cfg.relayPort >= 0 ? ", relay=" + std::to_string(cfg.relayPort) : "")
              << (withView ? ", view=on" : ", view=off")
              << ", outdir=" << outdir
              << "\n";

    std::filesystem::path last_frame_path;

    try {
        std::filesystem::create_directories(outdir);
        last_frame_path = std::filesystem::path(outdir) / saveName;

        // 3) optional sinks
        std::unique_ptr<rvfstream::FrameRecorder> recorder;
        if (!recordPath.empty()) {
            recorder = std::make_unique<rvfstream::FrameRecorder>(recordPath);
            if (!recorder->ok()) {
                std::cerr << "[receive] cannot open record file: " << recordPath << "\n";
                return 1;
            }
        }
        std::unique_ptr<rvfstream::GrpcServer> relay;
        if (cfg.relayPort >= 0) {
            rvfstream::GrpcServer::Options so{};
            so.maxQueue   = static_cast<int>(cfg.queueCapacity);
            so.dropOldest = cfg.drop == rvfstream::DropPolicy::Oldest;
            relay = std::make_unique<rvfstream::GrpcServer>(static_cast<std::uint16_t>(cfg.relayPort), so);
        }

        // 4) reassembly state: touched only by the receiver thread
        rvfstream::Reassembler reasm;
        rvfstream::LinkMonitor monitor(milliseconds(cfg.signalLostMs), milliseconds(cfg.suppressAfterLossMs));

        JitterBuffer jbuf(cfg.queueCapacity, cfg.drop);
        rvfstream::LinkStats link(rvfstream::Reassembler::H);

        std::atomic<bool> running{true};
        std::atomic<bool> paused{false};
        std::atomic<bool> resetRequested{false};
        std::atomic<std::uint64_t> usedFrames{0}, dropCount{0}, suppressedChunks{0};

        // reassembler counters published for the health thread
        std::mutex stats_mtx;
        rvfstream::Reassembler::Stats reStats{};
        std::uint64_t signalLosses = 0;

        // last frame for viewer / final PNG
        std::mutex last_mtx;
        std::vector<std::uint8_t> last_buf;
        rvfstream::FrameMeta last_meta{};

        const auto t0 = steady_clock::now();

        reasm.setFrameReadyHandler([&](std::vector<std::uint8_t> frame, const rvfstream::FrameMeta& meta) {
            const auto now = steady_clock::now();
            monitor.onFrame(now);

            RecvFrame rf;
            rf.buf      = std::move(frame);
            rf.width    = rvfstream::Reassembler::W;
            rf.height   = rvfstream::Reassembler::H;
            rf.meta     = meta;
            rf.t_arrive = now;
            jbuf.push(std::move(rf), dropCount);
        });

        // 5) UDP receiver: producer -> reassembler -> jbuf
        rvfstream::UdpReceiver::Options ro{};
        ro.port            = cfg.port;
        ro.recvBufferBytes = cfg.recvBufferBytes;
        ro.pollMs          = cfg.pollMs;
        ro.printDrops      = verbose;
        rvfstream::UdpReceiver rx(ro);

        rx.start(
            [&](const rvfstream::Chunk& c) {
                if (monitor.suppressed(steady_clock::now())) { ++suppressedChunks; return; }
                reasm.apply(c);
            },
            [&](steady_clock::time_point now) {
                if (resetRequested.exchange(false)) {
                    reasm.resetAll();
                    std::cout << "[receive] reassembler reset\n";
                }
                if (monitor.checkSignalLost(now)) {
                    reasm.resetAll();
                    std::cout << "[receive] signal lost, input suppressed for "
                              << cfg.suppressAfterLossMs << " ms\n";
                }
                std::lock_guard<std::mutex> lk(stats_mtx);
                reStats = reasm.stats();
                signalLosses = monitor.losses();
            });

        // 6) consumer thread
        std::thread consumer([&](){
            while (running) {
                RecvFrame rf;
                if (!jbuf.pop_wait(rf, 50)) continue;

                link.account(rf.meta);
                const rvfstream::Frame view = rf.view();

                if (recorder && !recorder->write(view, rf.meta)) {
                    std::cerr << "[receive] record write failed, recording stopped\n";
                    recorder.reset();
                }
                if (relay) relay->pushFrame(view, rf.meta);

                if (verbose) {
                    std::cout << "[frame] id=" << rf.meta.frameId << " seq=" << rf.meta.seq
                              << " lines=" << rf.meta.linesWritten << " gaps=" << rf.meta.seqGaps << "\n";
                }

                if (!paused) {
                    std::lock_guard<std::mutex> lk(last_mtx);
                    last_buf  = std::move(rf.buf);
                    last_meta = rf.meta;
                }
                ++usedFrames;
            }
        });

        // 7) health log
        std::thread health([&](){
            using clk = std::chrono::steady_clock;
            auto t0h = clk::now();
            std::uint64_t lastIn = 0, lastBytes = 0;

            while (running) {
                sleep_while(running, milliseconds(cfg.healthMs));
                if (!running) break;
                auto t1h = clk::now();
                double secs = std::max(1e-3, std::chrono::duration<double>(t1h - t0h).count());
                t0h = t1h;

                const auto ls = link.snapshot();
                const auto rc = rx.counters();
                rvfstream::Reassembler::Stats rs;
                std::uint64_t losses;
                {
                    std::lock_guard<std::mutex> lk(stats_mtx);
                    rs = reStats;
                    losses = signalLosses;
                }

                double fps_in = (ls.framesIn - lastIn) / secs;
                double mbytes = (rc.bytes - lastBytes) / secs / (1024.0*1024.0);
                lastIn = ls.framesIn;
                lastBytes = rc.bytes;

                std::cout << "[health] fps=" << std::round(fps_in*10)/10
                          << " frames=" << ls.framesIn
                          << " incomplete=" << ls.incomplete
                          << " gap_frames=" << ls.gapFrames
                          << " seq_gaps=" << ls.sumGaps
                          << " dropped=" << ls.dropped
                          << " qlen=" << jbuf.size()
                          << " qdrops=" << dropCount.load()
                          << " dgrams=" << rc.datagrams
                          << " non_rvf=" << rc.nonRvf
                          << " malformed=" << rc.malformed
                          << " bad_geom=" << rs.droppedGeometry
                          << " truncated=" << rs.droppedTruncated
                          << " suppressed=" << suppressedChunks.load()
                          << " losses=" << losses
                          << " bitrate=" << std::round(mbytes*100)/100 << " MB/s"
                          << (paused ? " [paused]" : "")
                          << "\n";
            }
        });

        // 8) viewer (optional); viewState: 0 starting, 1 up, 2 no window
        std::atomic<int> viewState{withView ? 0 : 2};
        std::thread viewer;
        if (withView) {
            viewer = std::thread([&](){
                try {
                    cv::namedWindow("RVF Viewer", cv::WINDOW_AUTOSIZE);
                } catch (const cv::Exception& e) {
                    std::cerr << "[view] failed to create window (" << e.what() << "); running headless.\n";
                    viewState = 2;
                    return;
                }
                viewState = 1;

                const int scale = 3;
                auto overlay = [&](cv::Mat& img, const rvfstream::FrameMeta& m){
                    int y = 18;
                    auto put = [&](const std::string& s){
                        cv::putText(img, s, {8,y}, cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255), 1, cv::LINE_AA);
                        y += 18;
                    };
                    const auto ls = link.snapshot();
                    put("FRAME " + std::to_string(m.frameId) + "  SEQ " + std::to_string(m.seq) +
                        "  LINES " + std::to_string(m.linesWritten) + "  GAPS " + std::to_string(m.seqGaps));
                    put("IN " + std::to_string(ls.framesIn) + "  DROPPED " + std::to_string(ls.dropped) +
                        "  QDROPS " + std::to_string(dropCount.load()));
                    put("[SPACE] pause  [R] reset  [S] save  [Q] quit");
                };

                while (running) {
                    std::vector<std::uint8_t> buf;
                    rvfstream::FrameMeta meta{};
                    {
                        std::lock_guard<std::mutex> lk(last_mtx);
                        buf = last_buf; meta = last_meta;
                    }

                    cv::Mat canvas;
                    if (buf.empty()) {
                        canvas = cv::Mat(rvfstream::Reassembler::H * scale, rvfstream::Reassembler::W * scale,
                                         CV_8UC1, cv::Scalar(0));
                        cv::putText(canvas, "Waiting for frames…", {40, canvas.rows/2},
                                    cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255), 2, cv::LINE_AA);
                    } else {
                        cv::Mat f(rvfstream::Reassembler::H, rvfstream::Reassembler::W, CV_8UC1, buf.data());
                        canvas = displayize(f, scale);
                        overlay(canvas, meta);
                    }
                    cv::imshow("RVF Viewer", canvas);

                    int key = cv::waitKey(15);
                    if (key < 0) continue;
                    key = std::tolower(key);
                    if (key == 'q' || key == 27) { // ESC
                        running = false;
                        break;
                    } else if (key == 's') {
                        if (!buf.empty()) {
                            cv::Mat f(rvfstream::Reassembler::H, rvfstream::Reassembler::W, CV_8UC1, buf.data());
                            save_gray_png(f, last_frame_path.string());
                        }
                    } else if (key == 'r') {
                        resetRequested = true;
                        link.reset();
                    } else if (key == ' ') {
                        paused = !paused;
                    }
                }
                cv::destroyWindow("RVF Viewer");
            });
        }

        // 9) wait for the end of the run
        while (viewState == 0) std::this_thread::sleep_for(milliseconds(10));
        wait_until_stopped(running, durationSec, viewState == 1, std::cin, "receive");
        if (viewer.joinable()) viewer.join();

        rx.shutdown();
        consumer.join();
        health.join();
        if (relay) {
            std::cout << "[receive] relay queue drops: " << relay->queueDrops() << "\n";
            relay.reset();
        }
        const std::uint64_t recorded = recorder ? recorder->frames() : 0;
        recorder.reset();

        // final PNG of the last frame
        bool havePng = false;
        {
            std::lock_guard<std::mutex> lk(last_mtx);
            if (!last_buf.empty()) {
                cv::Mat f(rvfstream::Reassembler::H, rvfstream::Reassembler::W, CV_8UC1, last_buf.data());
                havePng = save_gray_png(f, last_frame_path.string());
            }
        }

        // ---------- manifest JSON ----------
        const auto ls = link.snapshot();
        const auto rc = rx.counters();
        const auto rs = reasm.stats();
        const double dur_s = std::max(1e-6, duration<double>(steady_clock::now() - t0).count());
        const double mbps  = (rc.bytes / dur_s) / (1024.0*1024.0);

        std::vector<mist::Artifact> arts;
        if (havePng) arts.push_back(mist::describe_file(last_frame_path, "image/png"));
        if (!recordPath.empty() && std::filesystem::exists(recordPath))
            arts.push_back(mist::describe_file(recordPath, "record/rvr"));

        std::ostringstream j;
        j << "{\n";
        j << "  \"mist_version\": \"0.1\",\n";
        j << "  \"run_id\": \"" << runId << "\",\n";
        j << "  \"mode\": \"receive\",\n";
        j << "  \"started_at\": \"" << started << "\",\n";
        j << "  \"finished_at\": \"" << mist::iso_utc_now() << "\",\n";
        j << "  \"outdir\": \"" << mist::jesc(outdir) << "\",\n";
        j << "  \"cli\": { \"argv\": \"" << mist::jesc(mist::join_argv(argc, argv)) << "\" },\n";
        j << "  \"software\": {\n";
        j << "    \"rvfstream_version\": \"" << RVFSTREAM_VERSION << "\",\n";
        j << "    \"git_sha\": \"" << RVFSTREAM_GIT_SHA << "\",\n";
        j << "    \"opencv\": \"" << CV_VERSION << "\"\n";
        j << "  },\n";
        j << "  \"input\": { \"udp_port\": " << rx.boundPort() << " },\n";
        j << "  \"network\": { \"profile\": \"" << net << "\", \"bufcap\": " << cfg.queueCapacity
          << ", \"drop\": \"" << drop_name(cfg.drop) << "\", \"signal_lost_ms\": " << cfg.signalLostMs << " },\n";
        j << "  \"stats\": { \"frames_in\": " << ls.framesIn
          << ", \"frames_out\": " << usedFrames.load()
          << ", \"incomplete\": " << ls.incomplete
          << ", \"gap_frames\": " << ls.gapFrames
          << ", \"seq_gaps\": " << ls.sumGaps
          << ", \"queue_drops\": " << dropCount.load()
          << ", \"datagrams\": " << rc.datagrams
          << ", \"non_rvf\": " << rc.nonRvf
          << ", \"malformed\": " << rc.malformed
          << ", \"bad_geometry\": " << rs.droppedGeometry
          << ", \"truncated\": " << rs.droppedTruncated
          << ", \"recorded\": " << recorded
          << ", \"bytes_in\": " << rc.bytes
          << ", \"duration_s\": " << std::fixed << std::setprecision(3) << dur_s
          << ", \"mb_per_s\": " << std::fixed << std::setprecision(2) << mbps << " },\n";
        j << "  \"artifacts\": [\n";
        j << mist::artifacts_json(arts, "    ");
        j << "  ]\n";
        j << "}\n";

        const auto manifest_path = std::filesystem::path(outdir) / "manifest.json";
        if (mist::write_text_file(manifest_path, j.str()))
            std::cout << "[receive] manifest saved: " << manifest_path << "\n";
        else
            std::cerr << "[receive] failed to write manifest: " << manifest_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[receive] error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
