#include "analysis_types.hpp"
#include <stdexcept>

namespace formcheck {

const Landmark* LandmarkSet::find(const std::string& name) const {
    for (const auto& point : points) {
        if (point.name == name) {
            return &point;
        }
    }
    return nullptr;
}

json LandmarkSet::toJson() const {
    json j = json::array();
    for (const auto& point : points) {
        j.push_back({
            {"name", point.name},
            {"x", point.x},
            {"y", point.y},
            {"z", point.z},
            {"visibility", point.visibility}
        });
    }
    return j;
}

std::string alignmentIssueToString(AlignmentIssue issue) {
    switch (issue) {
        case AlignmentIssue::SHOULDER_IMBALANCE: return "Shoulder imbalance detected";
        case AlignmentIssue::HIP_IMBALANCE: return "Hip imbalance detected";
        case AlignmentIssue::KNEE_IMBALANCE: return "Knee imbalance detected";
        default: return "Unknown alignment issue";
    }
}

std::vector<std::string> PostureAnalysis::issueStrings() const {
    std::vector<std::string> issues;
    issues.reserve(alignment_issues.size());
    for (const auto& issue : alignment_issues) {
        issues.push_back(alignmentIssueToString(issue));
    }
    return issues;
}

json PostureAnalysis::toJson(bool include_keypoints) const {
    json j;
    j["posture_score"] = posture_score;
    j["alignment_issues"] = issueStrings();
    j["recommended_corrections"] = recommended_corrections;
    j["frames_analyzed"] = frames_analyzed;
    j["frames_with_landmarks"] = frames_with_landmarks;

    j["keypoints"] = json::array();
    if (include_keypoints) {
        for (const auto& set : keypoints) {
            j["keypoints"].push_back(set.toJson());
        }
    }
    return j;
}

json SkillAssessment::toJson() const {
    return json{
        {"score", score},
        {"confidence", confidence},
        {"feedback", feedback},
        {"strengths", strengths},
        {"areas_for_improvement", areas_for_improvement}
    };
}

std::string riskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH: return "high";
        default: return "unknown";
    }
}

json InjuryRiskPrediction::toJson() const {
    return json{
        {"risk_level", riskLevelToString(risk_level)},
        {"risk_score", risk_score},
        {"risk_factors", risk_factors},
        {"prevention_recommendations", prevention_recommendations}
    };
}

bool IntegrityVerdict::isWellFormed() const {
    if (confidence < 0.0f || confidence > 1.0f) {
        return false;
    }
    if (frames_analyzed < 0 || duplicate_frames < 0) {
        return false;
    }
    // At most one duplicate per consecutive pair
    if (frames_analyzed > 0 && duplicate_frames > frames_analyzed - 1) {
        return false;
    }
    if (frames_analyzed == 0 && duplicate_frames != 0) {
        return false;
    }
    return true;
}

json IntegrityVerdict::toJson() const {
    return json{
        {"is_cheating_detected", is_cheating_detected},
        {"confidence", confidence},
        {"detected_anomalies", detected_anomalies},
        {"frames_analyzed", frames_analyzed},
        {"duplicate_frames", duplicate_frames}
    };
}

IntegrityVerdict IntegrityVerdict::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("integrity verdict must be a JSON object");
    }

    IntegrityVerdict verdict;
    try {
        verdict.is_cheating_detected = j.at("is_cheating_detected").get<bool>();
        verdict.confidence = j.at("confidence").get<float>();
        verdict.detected_anomalies = j.at("detected_anomalies").get<std::vector<std::string>>();
        verdict.frames_analyzed = j.at("frames_analyzed").get<int>();
        verdict.duplicate_frames = j.at("duplicate_frames").get<int>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed integrity verdict: ") + e.what());
    }

    if (!verdict.isWellFormed()) {
        throw std::invalid_argument("integrity verdict values out of range");
    }
    return verdict;
}

} // namespace formcheck
