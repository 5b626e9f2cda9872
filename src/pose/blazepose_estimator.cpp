#include "blazepose_estimator.hpp"
#include "../analysis_errors.hpp"
#include <iostream>
#include <filesystem>
#include <cstring>
#include <cmath>

namespace formcheck {
namespace pose {

namespace {

// BlazePose topology, in model output order
const char* const LANDMARK_NAMES[BlazePoseEstimator::NUM_LANDMARKS] = {
    "nose",
    "left_eye_inner", "left_eye", "left_eye_outer",
    "right_eye_inner", "right_eye", "right_eye_outer",
    "left_ear", "right_ear",
    "mouth_left", "mouth_right",
    "left_shoulder", "right_shoulder",
    "left_elbow", "right_elbow",
    "left_wrist", "right_wrist",
    "left_pinky", "right_pinky",
    "left_index", "right_index",
    "left_thumb", "right_thumb",
    "left_hip", "right_hip",
    "left_knee", "right_knee",
    "left_ankle", "right_ankle",
    "left_heel", "right_heel",
    "left_foot_index", "right_foot_index"
};

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

int elementCount(const TfLiteTensor* tensor) {
    int count = 1;
    for (int i = 0; i < tensor->dims->size; ++i) {
        count *= tensor->dims->data[i];
    }
    return count;
}

} // namespace

bool BlazePoseModel::initialize(const std::string& model_path) {
    try {
        std::cout << "Loading BlazePose model..." << std::endl;

        if (!std::filesystem::exists(model_path)) {
            std::cerr << "Pose model not found: " << model_path << std::endl;
            return false;
        }

        std::unique_ptr<tflite::FlatBufferModel> model =
            tflite::FlatBufferModel::BuildFromFile(model_path.c_str());
        if (!model) {
            std::cerr << "Failed to load pose model from: " << model_path << std::endl;
            return false;
        }

        model_ = std::move(model);
        model_path_ = model_path;

        // Build one interpreter up front so a broken model fails here, not per request
        BlazePoseEstimator probe(model_);

        std::cout << "BlazePose model loaded successfully" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading pose model: " << e.what() << std::endl;
        model_.reset();
        return false;
    }
}

std::unique_ptr<PoseEstimator> BlazePoseModel::createEstimator() const {
    if (!model_) {
        throw PrimitiveFailure("pose model not loaded");
    }
    return std::make_unique<BlazePoseEstimator>(model_);
}

BlazePoseEstimator::BlazePoseEstimator(std::shared_ptr<tflite::FlatBufferModel> model)
    : model_(std::move(model)), input_width_(0), input_height_(0),
      landmarks_output_(-1), presence_output_(-1) {

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder builder(*model_, resolver);
    builder(&interpreter_);

    if (!interpreter_) {
        throw PrimitiveFailure("failed to create pose interpreter");
    }
    interpreter_->SetNumThreads(1);

    if (interpreter_->AllocateTensors() != kTfLiteOk) {
        throw PrimitiveFailure("failed to allocate pose tensors");
    }

    const TfLiteTensor* input = interpreter_->input_tensor(0);
    if (input->type != kTfLiteFloat32 || input->dims->size != 4 || input->dims->data[3] != 3) {
        throw PrimitiveFailure("unexpected pose model input tensor");
    }
    input_height_ = input->dims->data[1];
    input_width_ = input->dims->data[2];

    // The landmark and presence outputs are told apart by their sizes
    const auto& outputs = interpreter_->outputs();
    for (size_t i = 0; i < outputs.size(); ++i) {
        int count = elementCount(interpreter_->output_tensor(i));
        if (count == 39 * VALUES_PER_LANDMARK && landmarks_output_ < 0) {
            landmarks_output_ = static_cast<int>(i);
        } else if (count == 1 && presence_output_ < 0) {
            presence_output_ = static_cast<int>(i);
        }
    }

    if (landmarks_output_ < 0 || presence_output_ < 0) {
        throw PrimitiveFailure("pose model outputs not recognized");
    }
}

cv::Mat BlazePoseEstimator::preprocess(const cv::Mat& rgb_frame, const Letterbox& box) const {
    cv::Mat padded = box.apply(rgb_frame);

    // Float32 in [0, 1]
    cv::Mat input;
    padded.convertTo(input, CV_32FC3, 1.0 / 255.0);
    return input;
}

LandmarkSet BlazePoseEstimator::decodeLandmarks(const float* raw, const Letterbox& box) const {
    LandmarkSet set;
    set.points.reserve(NUM_LANDMARKS);

    for (int i = 0; i < NUM_LANDMARKS; ++i) {
        const float* values = raw + i * VALUES_PER_LANDMARK;
        cv::Point2f point = box.toNormalized(values[0], values[1]);

        set.points.emplace_back(LANDMARK_NAMES[i],
                                point.x,
                                point.y,
                                box.depthToNormalized(values[2]),
                                sigmoid(values[3]));
    }
    return set;
}

std::optional<LandmarkSet> BlazePoseEstimator::estimate(const cv::Mat& rgb_frame) {
    if (rgb_frame.empty() || rgb_frame.channels() != 3) {
        throw PrimitiveFailure("pose estimator expects a 3-channel RGB frame");
    }

    Letterbox box = Letterbox::fit(rgb_frame.size(), cv::Size(input_width_, input_height_));
    cv::Mat input = preprocess(rgb_frame, box);
    if (!input.isContinuous()) {
        input = input.clone();
    }

    float* input_data = interpreter_->typed_input_tensor<float>(0);
    std::memcpy(input_data, input.data, input.total() * input.elemSize());

    if (interpreter_->Invoke() != kTfLiteOk) {
        throw PrimitiveFailure("pose interpreter invocation failed");
    }

    const float* presence = interpreter_->typed_output_tensor<float>(presence_output_);
    if (presence[0] < PRESENCE_THRESHOLD) {
        return std::nullopt;
    }

    const float* raw = interpreter_->typed_output_tensor<float>(landmarks_output_);
    return decodeLandmarks(raw, box);
}

PoseEstimatorFactory makeBlazePoseFactory(const std::string& model_path) {
    auto model = std::make_shared<BlazePoseModel>();
    if (!model->initialize(model_path)) {
        return PoseEstimatorFactory();
    }

    return [model]() -> std::unique_ptr<PoseEstimator> {
        return model->createEstimator();
    };
}

} // namespace pose
} // namespace formcheck
