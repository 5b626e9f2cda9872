#ifndef FRAME_SAMPLER_HPP
#define FRAME_SAMPLER_HPP

#include "analysis_config.hpp"
#include "analysis_types.hpp"
#include <string>
#include <vector>

namespace formcheck {

// Decodes a video and keeps every stride-th frame, resized and color converted.
// The capture handle lives only for the duration of one sample() call.
class FrameSampler {
public:
    // Throws std::invalid_argument for a non-positive stride or empty size
    explicit FrameSampler(const SamplingSpec& spec);

    // Returns frames in presentation order with indices 0, k, 2k, ...
    // Throws DecodeError if the source cannot be opened or read.
    std::vector<Frame> sample(const std::string& video_path) const;

    const SamplingSpec& spec() const { return spec_; }

private:
    cv::Mat convert(const cv::Mat& frame) const;

    SamplingSpec spec_;
};

} // namespace formcheck

#endif // FRAME_SAMPLER_HPP
