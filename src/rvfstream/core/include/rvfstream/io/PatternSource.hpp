#pragma once
#include "rvfstream/core/Frame.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace rvfstream {

/**
 * Frame source for the sender: produces 320x80 Gray8 frames.
 *
 * Patterns: "gradient" (moving diagonal ramp), "grid", "checker", "noise",
 * "text:<TEXT>". With imagePath set, the image is loaded as gray and its
 * top-left 320x80 corner is used (smaller images are padded with black);
 * the same still image is returned every time.
 */
class PatternSource {
public:
    struct Options {
        std::string pattern = "gradient";
        std::string imagePath{};
        unsigned seed = 0;              // RNG seed for "noise" (0 = auto)
    };

    // Throws std::runtime_error if imagePath is set and cannot be read.
    explicit PatternSource(const Options& opt);
    PatternSource();

    std::optional<Frame> next();

    std::uint64_t produced() const { return counter_; }

private:
    Options opt_;
    cv::Mat still_;                    // 8UC1 W x H, set for image/static patterns
    std::vector<std::uint8_t> scratch_;
    std::uint64_t counter_ = 0;
    std::mt19937 rng_;

    void renderGradient(cv::Mat& dst) const;
    cv::Mat makeStatic(const std::string& pat);
};

} // namespace rvfstream
