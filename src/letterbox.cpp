#include "letterbox.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace formcheck {

Letterbox Letterbox::fit(const cv::Size& source, const cv::Size& target) {
    if (source.width <= 0 || source.height <= 0 || target.width <= 0 || target.height <= 0) {
        throw std::invalid_argument("letterbox needs non-empty source and target sizes");
    }

    Letterbox box;
    box.source = source;
    box.target = target;
    box.scale = std::min(static_cast<float>(target.width) / source.width,
                         static_cast<float>(target.height) / source.height);

    int scaled_w = std::max(1, static_cast<int>(std::round(source.width * box.scale)));
    int scaled_h = std::max(1, static_cast<int>(std::round(source.height * box.scale)));
    box.pad_x = (target.width - scaled_w) / 2;
    box.pad_y = (target.height - scaled_h) / 2;
    return box;
}

cv::Mat Letterbox::apply(const cv::Mat& image) const {
    int scaled_w = std::max(1, static_cast<int>(std::round(source.width * scale)));
    int scaled_h = std::max(1, static_cast<int>(std::round(source.height * scale)));

    // Odd leftovers go to the right and bottom edges

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(scaled_w, scaled_h));

    cv::Mat padded;
    cv::copyMakeBorder(resized, padded,
                       pad_y, target.height - scaled_h - pad_y,
                       pad_x, target.width - scaled_w - pad_x,
                       cv::BORDER_CONSTANT, cv::Scalar::all(0));
    return padded;
}

cv::Point2f Letterbox::toNormalized(float model_x, float model_y) const {
    float content_w = source.width * scale;
    float content_h = source.height * scale;

    float x = (model_x - pad_x) / content_w;
    float y = (model_y - pad_y) / content_h;
    return cv::Point2f(std::clamp(x, 0.0f, 1.0f), std::clamp(y, 0.0f, 1.0f));
}

float Letterbox::depthToNormalized(float model_z) const {
    return model_z / (source.width * scale);
}

} // namespace formcheck
