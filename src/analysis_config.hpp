#ifndef ANALYSIS_CONFIG_HPP
#define ANALYSIS_CONFIG_HPP

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <cstddef>

using json = nlohmann::json;

namespace formcheck {

enum class ColorMode {
    BGR = 0,
    RGB = 1,
    GRAY = 2
};

// One invocation of the frame sampler: every stride-th frame, resized to size
struct SamplingSpec {
    int stride;
    cv::Size size;
    ColorMode color;

    SamplingSpec() : stride(1), size(0, 0), color(ColorMode::BGR) {}
    SamplingSpec(int s, cv::Size sz, ColorMode c) : stride(s), size(sz), color(c) {}
};

struct AnalysisConfig {
    int frame_stride_posture = 10;
    int frame_stride_integrity = 5;
    cv::Size resolution_posture{640, 480};
    cv::Size resolution_integrity{224, 224};

    // Empirical constants, no calibration procedure behind them
    double duplicate_similarity_threshold = 0.95;
    double duplicate_rate_threshold = 0.10;
    double motion_outlier_sigma = 2.0;

    SamplingSpec postureSampling() const {
        return SamplingSpec(frame_stride_posture, resolution_posture, ColorMode::RGB);
    }

    SamplingSpec integritySampling() const {
        return SamplingSpec(frame_stride_integrity, resolution_integrity, ColorMode::GRAY);
    }

    // Throws std::invalid_argument describing the first invalid field
    void validate() const;

    json toJson() const;

    // Reads the recognized keys from j on top of defaults; unknown keys are ignored
    static AnalysisConfig fromJson(const json& j, const AnalysisConfig& defaults = AnalysisConfig());
};

struct ServiceConfig {
    int port = 8080;
    std::string models_path = "./models";
    int workers = 0;            // 0 = one per hardware thread
    int timeout_seconds = 120;  // <= 0 disables the deadline
    std::string config_file;
    std::string analyze_file;   // One-shot mode when set
    std::string sport_type = "general";
    std::string skill_type = "general";
    AnalysisConfig analysis;

    // Applies FORMCHECK_* environment variables
    void applyEnvironment();

    // Loads analysis defaults from config_file, if one was given
    bool loadAnalysisDefaults();

    std::size_t resolvedWorkerCount() const;
    std::string poseModelPath() const;
};

} // namespace formcheck

#endif // ANALYSIS_CONFIG_HPP
