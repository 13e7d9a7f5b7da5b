#include "utils.hpp"
#include <rvfstream/io/Recorder.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

cv::Mat frame_to_mat(const rvfstream::Frame& f) {
    if (f.width == 0 || f.height == 0 || f.data.size() != f.bytes()) return {};
    cv::Mat view(static_cast<int>(f.height), static_cast<int>(f.width), CV_8UC1,
                 const_cast<std::uint8_t*>(f.data.data()));
    return view.clone();
}

/*
  Prepare an image for on-screen display.

  - Pixel values are shown as-is, no contrast stretch.
  - Upscale with INTER_NEAREST so individual rows stay visible.
*/
cv::Mat displayize(const cv::Mat& src8u, int scale) {
    if (src8u.empty()) return {};
    if (scale <= 1) return src8u.clone();
    cv::Mat dst;
    cv::resize(src8u, dst, cv::Size(), scale, scale, cv::INTER_NEAREST);
    return dst;
}

bool save_gray_png(const cv::Mat& m, const std::string& path) {
    if (m.empty()) {
        std::cout << "[save] no frame yet, nothing to save\n";
        return false;
    }
    if (cv::imwrite(path, m)) {
        std::cout << "[save] frame saved to " << path
                  << " (" << m.cols << "x" << m.rows << ")\n";
        return true;
    }
    std::cerr << "[save] failed to save " << path << "\n";
    return false;
}

void sleep_while(const std::atomic<bool>& running, std::chrono::milliseconds total) {
    const auto until = std::chrono::steady_clock::now() + total;
    while (running && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
}

void wait_until_stopped(std::atomic<bool>& running, int durationSec, bool viewerUp,
                        std::istream& in, const std::string& tag) {
    if (durationSec > 0) {
        sleep_while(running, std::chrono::seconds(durationSec));
    } else if (viewerUp) {
        while (running) std::this_thread::sleep_for(std::chrono::milliseconds(20));
    } else {
        std::cout << "[" << tag << "] press Enter to stop.\n";
        in.get();
    }
    running = false;
}

bool export_capture_png(rvfstream::FramePlayer& player, const std::string& dir, ExportSummary& out) {
    std::filesystem::create_directories(dir);

    std::vector<std::uint8_t> scratch;
    rvfstream::Frame f{};
    rvfstream::FrameMeta meta{};
    bool crc_ok = true;
    std::uint64_t index = 0;

    while (player.readNext(f, scratch, &meta, nullptr, &crc_ok)) {
        const std::uint64_t n = index++;
        const cv::Mat m = frame_to_mat(f);
        if (m.empty()) {
            ++out.badRecords;
            std::cerr << "[export] record " << n << ": " << f.width << "x" << f.height
                      << " does not match " << f.data.size() << " bytes, skipped\n";
            continue;
        }
        if (!crc_ok) ++out.crcErrors;

        std::ostringstream name;
        name << "frame_" << std::setw(6) << std::setfill('0') << n << "_id" << meta.frameId << ".png";
        if (!save_gray_png(m, (std::filesystem::path(dir) / name.str()).string())) return false;
        ++out.frames;
    }
    return true;
}
