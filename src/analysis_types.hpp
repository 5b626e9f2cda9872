#ifndef ANALYSIS_TYPES_HPP
#define ANALYSIS_TYPES_HPP

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <vector>
#include <set>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace formcheck {

// Landmark names used by the posture heuristics (BlazePose topology)
namespace landmark_names {
constexpr const char* LEFT_SHOULDER = "left_shoulder";
constexpr const char* RIGHT_SHOULDER = "right_shoulder";
constexpr const char* LEFT_HIP = "left_hip";
constexpr const char* RIGHT_HIP = "right_hip";
constexpr const char* LEFT_KNEE = "left_knee";
constexpr const char* RIGHT_KNEE = "right_knee";
} // namespace landmark_names

// One decoded, resized frame of the source video
struct Frame {
    int index;          // Position in the decoded stream (0, k, 2k, ...)
    double timestamp;   // Seconds from the start of the video
    cv::Mat image;

    Frame() : index(0), timestamp(0.0) {}
    Frame(int idx, double ts, cv::Mat img) : index(idx), timestamp(ts), image(std::move(img)) {}
};

struct Landmark {
    std::string name;
    float x;            // Normalized [0,1] image coordinates
    float y;
    float z;
    float visibility;

    Landmark() : x(0.0f), y(0.0f), z(0.0f), visibility(0.0f) {}
    Landmark(std::string n, float px, float py, float pz, float vis = 1.0f)
        : name(std::move(n)), x(px), y(py), z(pz), visibility(vis) {}
};

struct LandmarkSet {
    std::vector<Landmark> points;

    // Returns nullptr when the estimator did not report the named landmark
    const Landmark* find(const std::string& name) const;

    bool empty() const { return points.empty(); }
    json toJson() const;
};

enum class AlignmentIssue {
    SHOULDER_IMBALANCE = 0,
    HIP_IMBALANCE = 1,
    KNEE_IMBALANCE = 2
};

std::string alignmentIssueToString(AlignmentIssue issue);

struct PostureMetrics {
    float score;
    std::set<AlignmentIssue> issues;
    LandmarkSet keypoints;

    PostureMetrics() : score(0.0f) {}
};

struct PostureAnalysis {
    float posture_score;                        // Mean over frames with landmarks, 0 if none
    std::set<AlignmentIssue> alignment_issues;  // Union across frames
    std::vector<std::string> recommended_corrections;
    std::vector<LandmarkSet> keypoints;         // One entry per frame with landmarks
    int frames_analyzed;
    int frames_with_landmarks;

    PostureAnalysis() : posture_score(0.0f), frames_analyzed(0), frames_with_landmarks(0) {}

    std::vector<std::string> issueStrings() const;
    json toJson(bool include_keypoints = true) const;
};

struct SkillAssessment {
    float score;        // 0-100
    float confidence;   // 0-1
    std::string feedback;
    std::vector<std::string> strengths;
    std::vector<std::string> areas_for_improvement;

    SkillAssessment() : score(0.0f), confidence(0.0f) {}

    json toJson() const;
};

struct SimilarityReport {
    bool is_duplicated;
    float confidence;
    int duplicate_count;
    std::vector<std::string> anomalies;

    SimilarityReport() : is_duplicated(false), confidence(0.0f), duplicate_count(0) {}
};

struct MotionReport {
    bool is_unnatural;
    float confidence;
    std::vector<std::string> anomalies;
    std::vector<double> magnitudes;   // Mean flow magnitude per measured pair
    double mean_magnitude;
    double stddev_magnitude;

    MotionReport() : is_unnatural(false), confidence(0.0f), mean_magnitude(0.0), stddev_magnitude(0.0) {}
};

enum class RiskLevel {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

std::string riskLevelToString(RiskLevel level);

struct InjuryRiskPrediction {
    RiskLevel risk_level;
    double risk_score;      // 0-1, rounded to 2 decimals
    std::vector<std::string> risk_factors;
    std::vector<std::string> prevention_recommendations;

    InjuryRiskPrediction() : risk_level(RiskLevel::LOW), risk_score(0.0) {}

    json toJson() const;
};

struct IntegrityVerdict {
    bool is_cheating_detected;
    float confidence;
    std::vector<std::string> detected_anomalies;
    int frames_analyzed;
    int duplicate_frames;

    IntegrityVerdict() : is_cheating_detected(false), confidence(0.0f), frames_analyzed(0), duplicate_frames(0) {}

    // Range checks a downstream consumer applies before trusting a verdict
    bool isWellFormed() const;

    json toJson() const;

    // Throws std::invalid_argument on missing fields or a verdict that is not well formed
    static IntegrityVerdict fromJson(const json& j);
};

} // namespace formcheck

#endif // ANALYSIS_TYPES_HPP
