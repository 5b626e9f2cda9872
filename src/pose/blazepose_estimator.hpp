#pragma once

#include "../pose_estimator.hpp"
#include "../letterbox.hpp"
#include <opencv2/opencv.hpp>
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>
#include <memory>
#include <optional>
#include <string>

namespace formcheck {
namespace pose {

// BlazePose landmark model (pose_landmark_lite.tflite), loaded once and shared
// read-only by every estimator built from it.
class BlazePoseModel {
public:
    BlazePoseModel() = default;

    // Loads the flatbuffer; logs and returns false on failure
    bool initialize(const std::string& model_path);

    bool isLoaded() const { return model_ != nullptr; }
    const std::string& modelPath() const { return model_path_; }

    // Builds an estimator with its own interpreter. Throws PrimitiveFailure.
    std::unique_ptr<PoseEstimator> createEstimator() const;

private:
    std::shared_ptr<tflite::FlatBufferModel> model_;
    std::string model_path_;
};

class BlazePoseEstimator : public PoseEstimator {
public:
    static constexpr int NUM_LANDMARKS = 33;
    static constexpr int VALUES_PER_LANDMARK = 5;    // x, y, z, visibility, presence
    static constexpr float PRESENCE_THRESHOLD = 0.5f;

    explicit BlazePoseEstimator(std::shared_ptr<tflite::FlatBufferModel> model);

    std::optional<LandmarkSet> estimate(const cv::Mat& rgb_frame) override;

private:
    cv::Mat preprocess(const cv::Mat& rgb_frame, const Letterbox& box) const;
    LandmarkSet decodeLandmarks(const float* raw, const Letterbox& box) const;

    // Declared before the interpreter so it outlives it
    std::shared_ptr<tflite::FlatBufferModel> model_;
    std::unique_ptr<tflite::Interpreter> interpreter_;

    int input_width_;
    int input_height_;
    int landmarks_output_;   // Index into outputs(), -1 if not found
    int presence_output_;
};

// Factory for the analysis pipeline. Returns an empty function when the model
// cannot be loaded.
PoseEstimatorFactory makeBlazePoseFactory(const std::string& model_path);

} // namespace pose
} // namespace formcheck
