#ifndef POSE_ESTIMATOR_HPP
#define POSE_ESTIMATOR_HPP

#include "analysis_types.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace formcheck {

// Single-frame human pose primitive. One instance serves one analysis call
// and is never shared between threads.
class PoseEstimator {
public:
    virtual ~PoseEstimator() = default;

    // Returns std::nullopt when no person is found in the frame.
    // Throws PrimitiveFailure (or any std::exception) when inference fails.
    virtual std::optional<LandmarkSet> estimate(const cv::Mat& rgb_frame) = 0;
};

// Creates a fresh estimator context; may return nullptr if none can be built
using PoseEstimatorFactory = std::function<std::unique_ptr<PoseEstimator>()>;

} // namespace formcheck

#endif // POSE_ESTIMATOR_HPP
