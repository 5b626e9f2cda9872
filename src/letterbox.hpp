#ifndef LETTERBOX_HPP
#define LETTERBOX_HPP

#include <opencv2/core.hpp>

namespace formcheck {

// Aspect-preserving fit of a source image into a model input, centred with
// black padding, plus the inverse mapping for model-space coordinates.
struct Letterbox {
    cv::Size source;
    cv::Size target;
    float scale;
    int pad_x;
    int pad_y;

    // Throws std::invalid_argument for an empty source or target
    static Letterbox fit(const cv::Size& source, const cv::Size& target);

    // Resized and padded copy of image, exactly target-sized
    cv::Mat apply(const cv::Mat& image) const;

    // Model pixel coordinates to source-normalized [0,1], clamped
    cv::Point2f toNormalized(float model_x, float model_y) const;

    // Depth shares the x scale
    float depthToNormalized(float model_z) const;
};

} // namespace formcheck

#endif // LETTERBOX_HPP
