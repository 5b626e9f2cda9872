#include "injury_risk_scorer.hpp"
#include <cmath>

namespace formcheck {

RiskLevel InjuryRiskScorer::levelFor(double risk_score) {
    if (risk_score < MEDIUM_BREAKPOINT) {
        return RiskLevel::LOW;
    }
    if (risk_score < HIGH_BREAKPOINT) {
        return RiskLevel::MEDIUM;
    }
    return RiskLevel::HIGH;
}

std::string InjuryRiskScorer::recommendationFor(AlignmentIssue issue) {
    switch (issue) {
        case AlignmentIssue::SHOULDER_IMBALANCE: return "Incorporate shoulder stability exercises";
        case AlignmentIssue::HIP_IMBALANCE: return "Add hip mobility and strengthening exercises";
        case AlignmentIssue::KNEE_IMBALANCE: return "Focus on knee stabilization exercises";
        default: return "Focus on proper form during exercises";
    }
}

InjuryRiskPrediction InjuryRiskScorer::score(const PostureAnalysis& posture, double skill_score) const {
    // Additions stay unrounded; only the reported value is rounded
    double risk = BASE_RISK;
    if (posture.alignment_issues.size() > MANY_ISSUES) {
        risk += MANY_ISSUES_RISK;
    }
    if (posture.posture_score < SCORE_CUTOFF) {
        risk += LOW_POSTURE_RISK;
    }
    if (skill_score < SCORE_CUTOFF) {
        risk += LOW_SKILL_RISK;
    }

    InjuryRiskPrediction prediction;
    prediction.risk_level = levelFor(risk);
    prediction.risk_score = std::round(risk * 100.0) / 100.0;
    prediction.risk_factors = posture.issueStrings();

    prediction.prevention_recommendations = {
        "Focus on proper form during exercises",
        "Incorporate balance training",
        "Consider professional coaching for technique improvement"
    };
    for (const auto& issue : posture.alignment_issues) {
        prediction.prevention_recommendations.push_back(recommendationFor(issue));
    }

    return prediction;
}

} // namespace formcheck
