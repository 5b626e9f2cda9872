#ifndef INJURY_RISK_SCORER_HPP
#define INJURY_RISK_SCORER_HPP

#include "analysis_types.hpp"
#include <string>
#include <cstddef>

namespace formcheck {

// Deterministic fusion of posture findings and the skill score into a risk level
class InjuryRiskScorer {
public:
    static constexpr double BASE_RISK = 0.3;
    static constexpr double MANY_ISSUES_RISK = 0.3;     // More than MANY_ISSUES alignment issues
    static constexpr double LOW_POSTURE_RISK = 0.2;     // posture_score below SCORE_CUTOFF
    static constexpr double LOW_SKILL_RISK = 0.1;       // skill score below SCORE_CUTOFF
    static constexpr size_t MANY_ISSUES = 2;
    static constexpr double SCORE_CUTOFF = 70.0;
    static constexpr double MEDIUM_BREAKPOINT = 0.4;
    static constexpr double HIGH_BREAKPOINT = 0.7;

    InjuryRiskPrediction score(const PostureAnalysis& posture, double skill_score) const;

    static RiskLevel levelFor(double risk_score);
    static std::string recommendationFor(AlignmentIssue issue);
};

} // namespace formcheck

#endif // INJURY_RISK_SCORER_HPP
