#include "optical_flow.hpp"
#include "analysis_errors.hpp"
#include <opencv2/video/tracking.hpp>
#include <opencv2/imgproc.hpp>

namespace formcheck {

double FarnebackFlowEstimator::meanMagnitude(const cv::Mat& prev, const cv::Mat& next) {
    if (prev.empty() || next.empty() || prev.size() != next.size()) {
        throw PrimitiveFailure("optical flow needs two non-empty frames of equal size");
    }
    if (prev.type() != CV_8UC1 || next.type() != CV_8UC1) {
        throw PrimitiveFailure("optical flow expects 8-bit grayscale frames");
    }

    cv::Mat flow;
    cv::calcOpticalFlowFarneback(prev, next, flow,
                                 params_.pyr_scale, params_.levels, params_.winsize,
                                 params_.iterations, params_.poly_n, params_.poly_sigma,
                                 params_.flags);

    cv::Mat channels[2];
    cv::split(flow, channels);

    cv::Mat magnitude;
    cv::magnitude(channels[0], channels[1], magnitude);
    return cv::mean(magnitude)[0];
}

FlowEstimatorFactory FarnebackFlowEstimator::factory() {
    return []() -> std::unique_ptr<FlowEstimator> {
        return std::make_unique<FarnebackFlowEstimator>();
    };
}

} // namespace formcheck
