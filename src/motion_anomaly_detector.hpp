#ifndef MOTION_ANOMALY_DETECTOR_HPP
#define MOTION_ANOMALY_DETECTOR_HPP

#include "analysis_types.hpp"
#include "optical_flow.hpp"
#include <vector>

namespace formcheck {

// Flags frame pairs whose motion intensity is a statistical outlier.
// Assumes a roughly unimodal distribution of per-pair flow magnitudes.
class MotionAnomalyDetector {
public:
    static constexpr double DEFAULT_OUTLIER_SIGMA = 2.0;
    static constexpr double ZERO_STDDEV = 1e-9;

    explicit MotionAnomalyDetector(FlowEstimator& flow, double outlier_sigma = DEFAULT_OUTLIER_SIGMA);

    // Frames must be single-channel 8-bit. A pair whose flow fails is skipped.
    MotionReport detect(const std::vector<Frame>& frames);

    // Positions i with |values[i] - mean| > sigma * stddev. Empty when stddev is 0
    // or there are fewer than two values.
    static std::vector<size_t> findOutliers(const std::vector<double>& values, double sigma,
                                            double* mean_out = nullptr, double* stddev_out = nullptr);

private:
    FlowEstimator& flow_;
    double outlier_sigma_;
};

} // namespace formcheck

#endif // MOTION_ANOMALY_DETECTOR_HPP
