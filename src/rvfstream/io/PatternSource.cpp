#include "rvfstream/io/PatternSource.hpp"
#include "rvfstream/protocol/RvfProtocol.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace rvfstream {

namespace {
constexpr int kW = rvf::kWidth;
constexpr int kH = rvf::kHeight;
} // namespace

PatternSource::PatternSource()
    : PatternSource(Options{}) {}

PatternSource::PatternSource(const Options& opt)
    : opt_(opt)
{
    rng_.seed(opt_.seed ? opt_.seed : std::random_device{}());

    if (!opt_.imagePath.empty()) {
        cv::Mat m = cv::imread(opt_.imagePath, cv::IMREAD_GRAYSCALE);
        if (m.empty()) {
            throw std::runtime_error("PatternSource: failed to load image: " + opt_.imagePath);
        }
        if (m.type() != CV_8UC1) {
            cv::Mat g; m.convertTo(g, CV_8U); m = g;
        }
        // crop the top-left corner; pad with black if the image is smaller
        still_ = cv::Mat(kH, kW, CV_8UC1, cv::Scalar(0));
        const cv::Rect roi{0, 0, std::min(kW, m.cols), std::min(kH, m.rows)};
        m(roi).copyTo(still_(roi));
        return;
    }

    const std::string& pat = opt_.pattern;
    if (pat == "gradient" || pat == "noise") return;
    if (pat != "grid" && pat != "checker" && pat.rfind("text:", 0) != 0) {
        throw std::runtime_error("PatternSource: unknown pattern: " + pat);
    }
    still_ = makeStatic(pat);
}

void PatternSource::renderGradient(cv::Mat& dst) const {
    // ramp shifted by 3 per frame, 4 per row, 1 per column
    for (int y = 0; y < dst.rows; ++y) {
        std::uint8_t* p = dst.ptr<std::uint8_t>(y);
        const unsigned rowBase = static_cast<unsigned>(counter_ * 3 + static_cast<unsigned>(y) * 4);
        for (int x = 0; x < dst.cols; ++x) {
            p[x] = static_cast<std::uint8_t>((rowBase + static_cast<unsigned>(x)) & 0xFF);
        }
    }
}

cv::Mat PatternSource::makeStatic(const std::string& pat) {
    cv::Mat base(kH, kW, CV_8UC1, cv::Scalar(32));

    if (pat.rfind("text:", 0) == 0) {
        const std::string s = pat.substr(5);
        int font = cv::FONT_HERSHEY_SIMPLEX;
        double scale = 1.5;
        int thick = 2;
        cv::Size sz = cv::getTextSize(s, font, scale, thick, nullptr);
        cv::putText(base, s, {(kW - sz.width)/2, (kH + sz.height)/2}, font, scale, cv::Scalar(240), thick, cv::LINE_AA);
    } else if (pat == "checker") {
        const int cs = 16;
        for (int y = 0; y < kH; y += cs) {
            for (int x = 0; x < kW; x += cs) {
                if (((x/cs) + (y/cs)) & 1)
                    cv::rectangle(base, {x,y}, {std::min(x+cs,kW)-1, std::min(y+cs,kH)-1}, cv::Scalar(220), cv::FILLED);
            }
        }
    } else { // "grid"
        for (int y = 0; y < kH; y += 16) cv::line(base, {0,y}, {kW-1,y}, cv::Scalar(200), 1);
        for (int x = 0; x < kW; x += 16) cv::line(base, {x,0}, {x,kH-1}, cv::Scalar(200), 1);
        cv::rectangle(base, {0,0}, {kW-1,kH-1}, cv::Scalar(255), 1);
    }
    return base;
}

std::optional<Frame> PatternSource::next() {
    cv::Mat frame;
    if (!still_.empty()) {
        frame = still_;
    } else if (opt_.pattern == "noise") {
        frame = cv::Mat(kH, kW, CV_8UC1);
        std::uniform_int_distribution<int> d(0, 255);
        for (int y = 0; y < kH; ++y) {
            std::uint8_t* p = frame.ptr<std::uint8_t>(y);
            for (int x = 0; x < kW; ++x) p[x] = static_cast<std::uint8_t>(d(rng_));
        }
    } else {
        frame = cv::Mat(kH, kW, CV_8UC1);
        renderGradient(frame);
    }

    scratch_.assign(frame.datastart, frame.dataend);
    ++counter_;

    return Frame{
        std::span<const std::uint8_t>(scratch_.data(), scratch_.size()),
        static_cast<std::uint32_t>(kW),
        static_cast<std::uint32_t>(kH),
        std::chrono::steady_clock::now()
    };
}

} // namespace rvfstream
