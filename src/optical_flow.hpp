#ifndef OPTICAL_FLOW_HPP
#define OPTICAL_FLOW_HPP

#include <opencv2/core.hpp>
#include <functional>
#include <memory>

namespace formcheck {

// Dense optical-flow primitive reduced to one scalar per frame pair
class FlowEstimator {
public:
    virtual ~FlowEstimator() = default;

    // Mean per-pixel flow magnitude from prev to next. Throws on failure.
    virtual double meanMagnitude(const cv::Mat& prev, const cv::Mat& next) = 0;
};

using FlowEstimatorFactory = std::function<std::unique_ptr<FlowEstimator>()>;

class FarnebackFlowEstimator : public FlowEstimator {
public:
    struct Params {
        double pyr_scale = 0.5;
        int levels = 3;
        int winsize = 15;
        int iterations = 3;
        int poly_n = 5;
        double poly_sigma = 1.2;
        int flags = 0;
    };

    FarnebackFlowEstimator() = default;
    explicit FarnebackFlowEstimator(const Params& params) : params_(params) {}

    double meanMagnitude(const cv::Mat& prev, const cv::Mat& next) override;

    static FlowEstimatorFactory factory();

private:
    Params params_;
};

} // namespace formcheck

#endif // OPTICAL_FLOW_HPP
