#pragma once
#include <rvfstream/core/Frame.hpp>

#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <istream>
#include <string>

/*
  Helpers for viewing and saving frames.
  They never modify the pixels they are given.
*/

/* Wrap a Gray8 frame as a cv::Mat (deep copy). Empty if the size is wrong. */
cv::Mat frame_to_mat(const rvfstream::Frame& f);

/* Scale an 8-bit image by an integer factor with nearest-neighbour
   sampling, so 320x80 frames stay readable on screen. */
cv::Mat displayize(const cv::Mat& src8u, int scale);

/* Save a Gray8 image as PNG to 'path'.
   Prints a short message; returns false on failure. */
bool save_gray_png(const cv::Mat& m, const std::string& path);

namespace rvfstream { class FramePlayer; }

/* Result of exporting a capture as PNG files. */
struct ExportSummary {
    std::uint64_t frames{0};     // PNGs written
    std::uint64_t crcErrors{0};  // written, but the stored CRC did not match
    std::uint64_t badRecords{0}; // skipped: geometry does not match the pixel count
};

/* Write every remaining record of 'player' to 'dir' as frame_<n>_id<id>.png.
   Bad records are counted and skipped. Returns false only if a PNG cannot
   be written. */
bool export_capture_png(rvfstream::FramePlayer& player, const std::string& dir, ExportSummary& out);

/* Block until the run should end, then clear 'running'.
   - durationSec > 0 : until it elapses or 'running' goes false;
   - viewerUp        : until the viewer clears 'running';
   - otherwise       : until a line is read from 'in' (or it ends). */
void wait_until_stopped(std::atomic<bool>& running, int durationSec, bool viewerUp,
                        std::istream& in, const std::string& tag);

/* Sleep in short steps so a cleared 'running' is noticed quickly. */
void sleep_while(const std::atomic<bool>& running, std::chrono::milliseconds total);
