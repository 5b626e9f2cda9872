#include "skill_assessor.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace formcheck {

namespace {

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const std::pair<const char*, SportType> SPORT_NAMES[] = {
    {"basketball", SportType::BASKETBALL},
    {"tennis", SportType::TENNIS},
    {"soccer", SportType::SOCCER},
    {"baseball", SportType::BASEBALL},
    {"general", SportType::GENERAL},
};

const std::pair<const char*, SkillType> SKILL_NAMES[] = {
    {"shooting", SkillType::SHOOTING},
    {"dribbling", SkillType::DRIBBLING},
    {"defense", SkillType::DEFENSE},
    {"serving", SkillType::SERVING},
    {"swing", SkillType::SWING},
    {"kicking", SkillType::KICKING},
    {"throwing", SkillType::THROWING},
    {"gameplay", SkillType::GAMEPLAY},
    {"general", SkillType::GENERAL},
};

std::string issueFocus(AlignmentIssue issue) {
    switch (issue) {
        case AlignmentIssue::SHOULDER_IMBALANCE: return "Shoulder alignment";
        case AlignmentIssue::HIP_IMBALANCE: return "Hip alignment";
        case AlignmentIssue::KNEE_IMBALANCE: return "Knee alignment";
        default: return "Body alignment";
    }
}

// Built-in variants

class BasketballShootingAssessor : public MovementSkillAssessor {
public:
    BasketballShootingAssessor() : MovementSkillAssessor(Profile{
        "basketball shooting", 82.0f,
        {{AlignmentIssue::SHOULDER_IMBALANCE, 12.0f}, {AlignmentIssue::KNEE_IMBALANCE, 6.0f}},
        "Consistent release. Keep the shooting elbow under the ball.",
        {"Balanced base", "Smooth release"},
        {"Follow-through"}}) {}
};

class BasketballDribblingAssessor : public MovementSkillAssessor {
public:
    BasketballDribblingAssessor() : MovementSkillAssessor(Profile{
        "basketball dribbling", 80.0f,
        {{AlignmentIssue::HIP_IMBALANCE, 8.0f}, {AlignmentIssue::KNEE_IMBALANCE, 8.0f}},
        "Good ball control. Stay low and keep your eyes up.",
        {"Low dribble height", "Ball protection"},
        {"Weak-hand control"}}) {}
};

class BasketballDefenseAssessor : public MovementSkillAssessor {
public:
    BasketballDefenseAssessor() : MovementSkillAssessor(Profile{
        "basketball defense", 79.0f,
        {{AlignmentIssue::HIP_IMBALANCE, 10.0f}, {AlignmentIssue::KNEE_IMBALANCE, 10.0f}},
        "Active stance. Keep hips square to the ball handler.",
        {"Active hands", "Quick lateral steps"},
        {"Closeout balance"}}) {}
};

class TennisServeAssessor : public MovementSkillAssessor {
public:
    TennisServeAssessor() : MovementSkillAssessor(Profile{
        "tennis serving", 81.0f,
        {{AlignmentIssue::SHOULDER_IMBALANCE, 8.0f}, {AlignmentIssue::HIP_IMBALANCE, 6.0f}},
        "Solid service motion. Drive up through the legs into contact.",
        {"Consistent toss", "Full racquet extension"},
        {"Leg drive"}}) {}
};

class TennisSwingAssessor : public MovementSkillAssessor {
public:
    TennisSwingAssessor() : MovementSkillAssessor(Profile{
        "tennis swing", 80.0f,
        {{AlignmentIssue::SHOULDER_IMBALANCE, 8.0f}, {AlignmentIssue::HIP_IMBALANCE, 8.0f}},
        "Good unit turn. Finish the swing over the opposite shoulder.",
        {"Early preparation", "Stable contact point"},
        {"Follow-through"}}) {}
};

class SoccerKickingAssessor : public MovementSkillAssessor {
public:
    SoccerKickingAssessor() : MovementSkillAssessor(Profile{
        "soccer kicking", 80.0f,
        {{AlignmentIssue::HIP_IMBALANCE, 10.0f}, {AlignmentIssue::KNEE_IMBALANCE, 10.0f}},
        "Clean strike. Plant the standing foot beside the ball.",
        {"Approach angle", "Strike power"},
        {"Plant foot placement"}}) {}
};

class BaseballSwingAssessor : public MovementSkillAssessor {
public:
    BaseballSwingAssessor() : MovementSkillAssessor(Profile{
        "baseball swing", 79.0f,
        {{AlignmentIssue::SHOULDER_IMBALANCE, 8.0f}, {AlignmentIssue::HIP_IMBALANCE, 10.0f}},
        "Compact swing. Let the hips lead the hands.",
        {"Bat speed", "Stable head position"},
        {"Hip rotation timing"}}) {}
};

class BaseballThrowingAssessor : public MovementSkillAssessor {
public:
    BaseballThrowingAssessor() : MovementSkillAssessor(Profile{
        "baseball throwing", 80.0f,
        {{AlignmentIssue::SHOULDER_IMBALANCE, 12.0f}, {AlignmentIssue::HIP_IMBALANCE, 6.0f}},
        "Strong arm action. Step toward the target before release.",
        {"Arm speed", "Grip consistency"},
        {"Stride direction"}}) {}
};

} // namespace

std::string sportTypeToString(SportType sport) {
    for (const auto& entry : SPORT_NAMES) {
        if (entry.second == sport) {
            return entry.first;
        }
    }
    return "general";
}

std::string skillTypeToString(SkillType skill) {
    for (const auto& entry : SKILL_NAMES) {
        if (entry.second == skill) {
            return entry.first;
        }
    }
    return "general";
}

SportType sportTypeFromString(const std::string& name) {
    std::string lower = toLower(name);
    for (const auto& entry : SPORT_NAMES) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return SportType::GENERAL;
}

SkillType skillTypeFromString(const std::string& name) {
    std::string lower = toLower(name);
    for (const auto& entry : SKILL_NAMES) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return SkillType::GENERAL;
}

bool isKnownSportType(const std::string& name) {
    std::string lower = toLower(name);
    return std::any_of(std::begin(SPORT_NAMES), std::end(SPORT_NAMES),
                       [&lower](const auto& entry) { return lower == entry.first; });
}

bool isKnownSkillType(const std::string& name) {
    std::string lower = toLower(name);
    return std::any_of(std::begin(SKILL_NAMES), std::end(SKILL_NAMES),
                       [&lower](const auto& entry) { return lower == entry.first; });
}

SkillAssessment GeneralSkillAssessor::assess(const std::vector<Frame>& /*frames*/,
                                             const PostureAnalysis& /*posture*/) const {
    SkillAssessment assessment;
    assessment.score = SCORE;
    assessment.confidence = CONFIDENCE;
    assessment.feedback = "Good form overall. Focus on follow-through and balance.";
    assessment.strengths = {"Good acceleration", "Proper grip"};
    assessment.areas_for_improvement = {"Follow-through", "Balance maintenance"};
    return assessment;
}

MovementSkillAssessor::MovementSkillAssessor(Profile profile) : profile_(std::move(profile)) {
}

SkillAssessment MovementSkillAssessor::assess(const std::vector<Frame>& frames,
                                              const PostureAnalysis& posture) const {
    SkillAssessment assessment;
    assessment.feedback = profile_.feedback;
    assessment.strengths = profile_.strengths;
    assessment.areas_for_improvement = profile_.improvements;

    float score = profile_.base_score;
    for (const auto& issue : posture.alignment_issues) {
        auto weight = profile_.issue_weights.find(issue);
        if (weight == profile_.issue_weights.end()) {
            continue;
        }
        score -= weight->second;
        assessment.areas_for_improvement.push_back(issueFocus(issue) + " during " + profile_.movement);
    }
    assessment.score = std::clamp(score, 0.0f, 100.0f);

    if (frames.empty()) {
        assessment.confidence = 0.5f;
    } else {
        float ratio = static_cast<float>(posture.frames_with_landmarks) / static_cast<float>(frames.size());
        assessment.confidence = std::clamp(0.5f + 0.45f * ratio, 0.0f, 1.0f);
    }

    return assessment;
}

void SkillAssessorRegistry::registerAssessor(SportType sport, SkillType skill,
                                             std::unique_ptr<SkillAssessor> assessor) {
    if (!assessor) {
        return;
    }
    assessors_[std::make_pair(sport, skill)] = std::move(assessor);
}

const SkillAssessor& SkillAssessorRegistry::find(SportType sport, SkillType skill) const {
    auto exact = assessors_.find(std::make_pair(sport, skill));
    if (exact != assessors_.end()) {
        return *exact->second;
    }

    auto sport_general = assessors_.find(std::make_pair(sport, SkillType::GENERAL));
    if (sport_general != assessors_.end()) {
        return *sport_general->second;
    }

    return general_;
}

SkillAssessment SkillAssessorRegistry::assess(SportType sport, SkillType skill,
                                              const std::vector<Frame>& frames,
                                              const PostureAnalysis& posture) const {
    const SkillAssessor& assessor = find(sport, skill);
    SkillAssessment assessment = assessor.assess(frames, posture);

    std::cout << "Skill assessment (" << assessor.name() << "): score=" << assessment.score
              << ", confidence=" << assessment.confidence << std::endl;
    return assessment;
}

SkillAssessorRegistry SkillAssessorRegistry::withDefaults() {
    SkillAssessorRegistry registry;
    registry.registerAssessor(SportType::BASKETBALL, SkillType::SHOOTING, std::make_unique<BasketballShootingAssessor>());
    registry.registerAssessor(SportType::BASKETBALL, SkillType::DRIBBLING, std::make_unique<BasketballDribblingAssessor>());
    registry.registerAssessor(SportType::BASKETBALL, SkillType::DEFENSE, std::make_unique<BasketballDefenseAssessor>());
    registry.registerAssessor(SportType::TENNIS, SkillType::SERVING, std::make_unique<TennisServeAssessor>());
    registry.registerAssessor(SportType::TENNIS, SkillType::SWING, std::make_unique<TennisSwingAssessor>());
    registry.registerAssessor(SportType::SOCCER, SkillType::KICKING, std::make_unique<SoccerKickingAssessor>());
    registry.registerAssessor(SportType::BASEBALL, SkillType::SWING, std::make_unique<BaseballSwingAssessor>());
    registry.registerAssessor(SportType::BASEBALL, SkillType::THROWING, std::make_unique<BaseballThrowingAssessor>());
    return registry;
}

} // namespace formcheck
