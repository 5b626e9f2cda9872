#include "frame_sampler.hpp"
#include "analysis_errors.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>
#include <filesystem>
#include <stdexcept>

namespace formcheck {

namespace {

// Releases the capture on every exit path
class CaptureGuard {
public:
    explicit CaptureGuard(cv::VideoCapture& cap) : cap_(cap) {}
    ~CaptureGuard() { cap_.release(); }

    CaptureGuard(const CaptureGuard&) = delete;
    CaptureGuard& operator=(const CaptureGuard&) = delete;

private:
    cv::VideoCapture& cap_;
};

} // namespace

FrameSampler::FrameSampler(const SamplingSpec& spec) : spec_(spec) {
    if (spec_.stride < 1) {
        throw std::invalid_argument("frame stride must be >= 1, got " + std::to_string(spec_.stride));
    }
    if (spec_.size.width <= 0 || spec_.size.height <= 0) {
        throw std::invalid_argument("target frame size must be positive");
    }
}

cv::Mat FrameSampler::convert(const cv::Mat& frame) const {
    cv::Mat resized;
    cv::resize(frame, resized, spec_.size);

    // Decoders may hand back 1 or 4 channel frames for some containers
    cv::Mat bgr;
    if (resized.channels() == 1) {
        cv::cvtColor(resized, bgr, cv::COLOR_GRAY2BGR);
    } else if (resized.channels() == 4) {
        cv::cvtColor(resized, bgr, cv::COLOR_BGRA2BGR);
    } else {
        bgr = resized;
    }

    cv::Mat out;
    switch (spec_.color) {
        case ColorMode::RGB:
            cv::cvtColor(bgr, out, cv::COLOR_BGR2RGB);
            break;
        case ColorMode::GRAY:
            cv::cvtColor(bgr, out, cv::COLOR_BGR2GRAY);
            break;
        case ColorMode::BGR:
        default:
            out = bgr.clone();
            break;
    }
    return out;
}

std::vector<Frame> FrameSampler::sample(const std::string& video_path) const {
    std::vector<Frame> frames;

    if (!std::filesystem::exists(video_path)) {
        throw DecodeError("video not found: " + video_path);
    }

    cv::VideoCapture cap;
    CaptureGuard guard(cap);

    try {
        if (!cap.open(video_path)) {
            throw DecodeError("cannot open video: " + video_path);
        }

        double fps = cap.get(cv::CAP_PROP_FPS);
        int index = 0;
        cv::Mat frame;

        while (cap.read(frame)) {
            if (frame.empty()) {
                break;
            }
            if (index % spec_.stride == 0) {
                double timestamp = fps > 0.0 ? static_cast<double>(index) / fps : 0.0;
                frames.emplace_back(index, timestamp, convert(frame));
            }
            index++;
        }
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("failed to decode video: ") + e.what());
    }

    return frames;
}

} // namespace formcheck
