#include "analysis_config.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <thread>
#include <stdexcept>

namespace formcheck {

namespace {

cv::Size parseResolution(const json& value, const std::string& key) {
    if (!value.is_array() || value.size() != 2 || !value[0].is_number_integer() || !value[1].is_number_integer()) {
        throw std::invalid_argument(key + " must be an array of two integers [width, height]");
    }
    return cv::Size(value[0].get<int>(), value[1].get<int>());
}

int parseInt(const json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(key + " must be an integer");
    }
    return value.get<int>();
}

double parseNumber(const json& value, const std::string& key) {
    if (!value.is_number()) {
        throw std::invalid_argument(key + " must be a number");
    }
    return value.get<double>();
}

bool readIntEnv(const char* name, int& target) {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') {
        return false;
    }
    try {
        target = std::stoi(raw);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Warning: ignoring non-numeric " << name << "=" << raw << std::endl;
        return false;
    }
}

} // namespace

void AnalysisConfig::validate() const {
    if (frame_stride_posture < 1) {
        throw std::invalid_argument("frame_stride_posture must be >= 1");
    }
    if (frame_stride_integrity < 1) {
        throw std::invalid_argument("frame_stride_integrity must be >= 1");
    }
    if (resolution_posture.width <= 0 || resolution_posture.height <= 0) {
        throw std::invalid_argument("resolution_posture must be positive");
    }
    if (resolution_integrity.width <= 0 || resolution_integrity.height <= 0) {
        throw std::invalid_argument("resolution_integrity must be positive");
    }
    if (duplicate_similarity_threshold < 0.0 || duplicate_similarity_threshold > 1.0) {
        throw std::invalid_argument("duplicate_similarity_threshold must be within [0, 1]");
    }
    if (duplicate_rate_threshold < 0.0 || duplicate_rate_threshold > 1.0) {
        throw std::invalid_argument("duplicate_rate_threshold must be within [0, 1]");
    }
    if (motion_outlier_sigma <= 0.0) {
        throw std::invalid_argument("motion_outlier_sigma must be > 0");
    }
}

json AnalysisConfig::toJson() const {
    return json{
        {"frame_stride_posture", frame_stride_posture},
        {"frame_stride_integrity", frame_stride_integrity},
        {"resolution_posture", {resolution_posture.width, resolution_posture.height}},
        {"resolution_integrity", {resolution_integrity.width, resolution_integrity.height}},
        {"duplicate_similarity_threshold", duplicate_similarity_threshold},
        {"duplicate_rate_threshold", duplicate_rate_threshold},
        {"motion_outlier_sigma", motion_outlier_sigma}
    };
}

AnalysisConfig AnalysisConfig::fromJson(const json& j, const AnalysisConfig& defaults) {
    AnalysisConfig config = defaults;

    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("config must be a JSON object");
    }

    if (j.contains("frame_stride_posture")) {
        config.frame_stride_posture = parseInt(j["frame_stride_posture"], "frame_stride_posture");
    }
    if (j.contains("frame_stride_integrity")) {
        config.frame_stride_integrity = parseInt(j["frame_stride_integrity"], "frame_stride_integrity");
    }
    if (j.contains("resolution_posture")) {
        config.resolution_posture = parseResolution(j["resolution_posture"], "resolution_posture");
    }
    if (j.contains("resolution_integrity")) {
        config.resolution_integrity = parseResolution(j["resolution_integrity"], "resolution_integrity");
    }
    if (j.contains("duplicate_similarity_threshold")) {
        config.duplicate_similarity_threshold =
            parseNumber(j["duplicate_similarity_threshold"], "duplicate_similarity_threshold");
    }
    if (j.contains("duplicate_rate_threshold")) {
        config.duplicate_rate_threshold = parseNumber(j["duplicate_rate_threshold"], "duplicate_rate_threshold");
    }
    if (j.contains("motion_outlier_sigma")) {
        config.motion_outlier_sigma = parseNumber(j["motion_outlier_sigma"], "motion_outlier_sigma");
    }

    config.validate();
    return config;
}

void ServiceConfig::applyEnvironment() {
    readIntEnv("FORMCHECK_PORT", port);
    readIntEnv("FORMCHECK_WORKERS", workers);
    readIntEnv("FORMCHECK_TIMEOUT_SECONDS", timeout_seconds);

    const char* models = std::getenv("FORMCHECK_MODELS_DIR");
    if (models && *models != '\0') {
        models_path = models;
    }
}

bool ServiceConfig::loadAnalysisDefaults() {
    if (config_file.empty()) {
        return true;
    }

    std::ifstream file(config_file);
    if (!file.good()) {
        std::cerr << "Config file not found: " << config_file << std::endl;
        return false;
    }

    try {
        json j = json::parse(file);
        analysis = AnalysisConfig::fromJson(j, analysis);
        std::cout << "Loaded analysis defaults from " << config_file << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Invalid config file " << config_file << ": " << e.what() << std::endl;
        return false;
    }
}

std::size_t ServiceConfig::resolvedWorkerCount() const {
    if (workers > 0) {
        return static_cast<std::size_t>(workers);
    }
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 1;
}

std::string ServiceConfig::poseModelPath() const {
    return models_path + "/pose_landmark_lite.tflite";
}

} // namespace formcheck
