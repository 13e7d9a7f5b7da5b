#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "rvfstream/core/LinkStats.hpp"
#include "rvfstream/io/GrpcClient.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"

#include <opencv2/highgui.hpp>
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <cctype>

int run_watch(int argc, char** argv) {
    const std::string net        = argValue(argc, argv, "net", "balanced");
    const std::string serverAddr = argValue(argc, argv, "server", "localhost:50071");
    const std::string save       = argValue(argc, argv, "save", "watch_last.png");
    const bool withView          = argHas(argc, argv, "view");
    const bool verbose           = argHas(argc, argv, "verbose");
    const int durationSec        = std::max(0, argValueInt(argc, argv, "duration", 0));

    rvfstream::GrpcClient::Options co{};
    if (net == "fast") {
        co.reconnectInitialMs = 200; co.reconnectMaxMs = 2000; co.idleLogMs = 4000;
    } else if (net == "robust") {
        co.reconnectInitialMs = 300; co.reconnectMaxMs = 8000; co.idleLogMs = 2000;
    } else { // balanced
        co.reconnectInitialMs = 250; co.reconnectMaxMs = 5000; co.idleLogMs = 2500;
    }

    std::cout << "[watch] server=" << serverAddr << ", net=" << net
              << (withView ? ", view=on" : ", view=off") << "\n";

    rvfstream::LinkStats link(rvfstream::rvf::kHeight);
    std::atomic<bool> running{true};

    std::mutex last_mtx;
    cv::Mat last;
    rvfstream::FrameMeta last_meta{};

    try {
        rvfstream::GrpcClient client(serverAddr, co);
        client.start([&](const rvfstream::Frame& f, const rvfstream::FrameMeta& meta) {
            link.account(meta);
            if (verbose) {
                std::cout << "[frame] id=" << meta.frameId << " seq=" << meta.seq
                          << " lines=" << meta.linesWritten << " gaps=" << meta.seqGaps << "\n";
            }
            cv::Mat m = frame_to_mat(f);
            std::lock_guard<std::mutex> lk(last_mtx);
            last = std::move(m);
            last_meta = meta;
        });

        const auto t0 = std::chrono::steady_clock::now();
        auto expired = [&]{
            return durationSec > 0 &&
                   std::chrono::steady_clock::now() - t0 >= std::chrono::seconds(durationSec);
        };

        bool window = false;
        if (withView) {
            window = true;
            try {
                cv::namedWindow("RVF Watch", cv::WINDOW_AUTOSIZE);
            } catch (const cv::Exception& e) {
                std::cerr << "[watch] failed to create window (" << e.what() << "); running headless.\n";
                window = false;
            }
            while (window && running && !expired()) {
                cv::Mat shown;
                {
                    std::lock_guard<std::mutex> lk(last_mtx);
                    if (!last.empty()) shown = displayize(last, 3);
                }
                if (!shown.empty()) cv::imshow("RVF Watch", shown);
                int key = cv::waitKey(15);
                if (key < 0) continue;
                key = std::tolower(key);
                if (key == 'q' || key == 27) running = false;
                else if (key == 's') {
                    std::lock_guard<std::mutex> lk(last_mtx);
                    save_gray_png(last, save);
                }
            }
            if (window) cv::destroyWindow("RVF Watch");
        }

        if (window) running = false;
        else wait_until_stopped(running, durationSec, false, std::cin, "watch");
        client.shutdown();

        const auto s = link.snapshot();
        std::cout << "[watch] frames=" << s.framesIn
                  << " incomplete=" << s.incomplete
                  << " gap_frames=" << s.gapFrames
                  << " dropped=" << s.dropped
                  << " crc_errors=" << client.crcErrors()
                  << " relay_gaps=" << client.relayGaps()
                  << " last_id=" << last_meta.frameId << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[watch] error: " << e.what() << '\n';
        return 1;
    }

    std::lock_guard<std::mutex> lk(last_mtx);
    save_gray_png(last, save);
    return 0;
}
