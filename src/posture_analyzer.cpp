#include "posture_analyzer.hpp"
#include <iostream>
#include <cmath>
#include <algorithm>

namespace formcheck {

namespace {

struct SymmetryCheck {
    const char* left;
    const char* right;
    AlignmentIssue issue;
    float penalty;
};

const SymmetryCheck SYMMETRY_CHECKS[] = {
    {landmark_names::LEFT_SHOULDER, landmark_names::RIGHT_SHOULDER,
     AlignmentIssue::SHOULDER_IMBALANCE, PostureAnalyzer::SHOULDER_PENALTY},
    {landmark_names::LEFT_HIP, landmark_names::RIGHT_HIP,
     AlignmentIssue::HIP_IMBALANCE, PostureAnalyzer::HIP_PENALTY},
    {landmark_names::LEFT_KNEE, landmark_names::RIGHT_KNEE,
     AlignmentIssue::KNEE_IMBALANCE, PostureAnalyzer::KNEE_PENALTY},
};

} // namespace

PostureAnalyzer::PostureAnalyzer(PoseEstimator& estimator) : estimator_(estimator) {
}

PostureMetrics PostureAnalyzer::scoreLandmarks(const LandmarkSet& landmarks) {
    PostureMetrics metrics;
    metrics.score = BASE_SCORE;
    metrics.keypoints = landmarks;

    for (const auto& check : SYMMETRY_CHECKS) {
        const Landmark* left = landmarks.find(check.left);
        const Landmark* right = landmarks.find(check.right);
        // A pair with a missing side contributes nothing
        if (!left || !right) {
            continue;
        }
        if (std::fabs(left->y - right->y) > IMBALANCE_THRESHOLD) {
            metrics.score -= check.penalty;
            metrics.issues.insert(check.issue);
        }
    }

    metrics.score = std::max(0.0f, metrics.score);
    return metrics;
}

std::string PostureAnalyzer::correctionFor(AlignmentIssue issue) {
    switch (issue) {
        case AlignmentIssue::SHOULDER_IMBALANCE:
            return "Keep shoulders level through the movement";
        case AlignmentIssue::HIP_IMBALANCE:
            return "Square the hips and keep weight evenly distributed";
        case AlignmentIssue::KNEE_IMBALANCE:
            return "Track both knees evenly over the feet";
        default:
            return "Review overall body alignment";
    }
}

PostureAnalysis PostureAnalyzer::analyze(const std::vector<Frame>& frames) {
    PostureAnalysis analysis;
    analysis.frames_analyzed = static_cast<int>(frames.size());

    float score_sum = 0.0f;

    for (const auto& frame : frames) {
        std::optional<LandmarkSet> landmarks;
        try {
            landmarks = estimator_.estimate(frame.image);
        } catch (const std::exception& e) {
            std::cerr << "Pose estimation failed on frame " << frame.index << ": " << e.what() << std::endl;
            continue;
        }

        if (!landmarks.has_value() || landmarks->empty()) {
            continue;
        }

        PostureMetrics metrics = scoreLandmarks(*landmarks);
        score_sum += metrics.score;
        analysis.alignment_issues.insert(metrics.issues.begin(), metrics.issues.end());
        analysis.keypoints.push_back(std::move(metrics.keypoints));
        analysis.frames_with_landmarks++;
    }

    if (analysis.frames_with_landmarks > 0) {
        analysis.posture_score = score_sum / analysis.frames_with_landmarks;
    }

    for (const auto& issue : analysis.alignment_issues) {
        analysis.recommended_corrections.push_back(correctionFor(issue));
    }

    std::cout << "Posture analysis: " << analysis.frames_with_landmarks << "/" << analysis.frames_analyzed
              << " frames with landmarks, score=" << analysis.posture_score
              << ", issues=" << analysis.alignment_issues.size() << std::endl;

    return analysis;
}

} // namespace formcheck
