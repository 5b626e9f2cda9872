#ifndef SKILL_ASSESSOR_HPP
#define SKILL_ASSESSOR_HPP

#include "analysis_types.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace formcheck {

enum class SportType {
    BASKETBALL = 0,
    TENNIS = 1,
    SOCCER = 2,
    BASEBALL = 3,
    GENERAL = 4
};

enum class SkillType {
    SHOOTING = 0,
    DRIBBLING = 1,
    DEFENSE = 2,
    SERVING = 3,
    SWING = 4,
    KICKING = 5,
    THROWING = 6,
    GAMEPLAY = 7,
    GENERAL = 8
};

std::string sportTypeToString(SportType sport);
std::string skillTypeToString(SkillType skill);

// Unknown names map to GENERAL (case-insensitive)
SportType sportTypeFromString(const std::string& name);
SkillType skillTypeFromString(const std::string& name);

// Strict variants used for request validation
bool isKnownSportType(const std::string& name);
bool isKnownSkillType(const std::string& name);

class SkillAssessor {
public:
    virtual ~SkillAssessor() = default;

    virtual std::string name() const = 0;

    // Pure function of the sampled posture frames and their analysis
    virtual SkillAssessment assess(const std::vector<Frame>& frames,
                                   const PostureAnalysis& posture) const = 0;
};

// Reference assessment used when nothing more specific is registered
class GeneralSkillAssessor : public SkillAssessor {
public:
    static constexpr float SCORE = 78.0f;
    static constexpr float CONFIDENCE = 0.85f;

    std::string name() const override { return "general"; }
    SkillAssessment assess(const std::vector<Frame>& frames,
                           const PostureAnalysis& posture) const override;
};

// Scores one movement from the alignment issues that matter to it
class MovementSkillAssessor : public SkillAssessor {
public:
    struct Profile {
        std::string movement;
        float base_score;
        std::map<AlignmentIssue, float> issue_weights;
        std::string feedback;
        std::vector<std::string> strengths;
        std::vector<std::string> improvements;
    };

    explicit MovementSkillAssessor(Profile profile);

    std::string name() const override { return profile_.movement; }
    SkillAssessment assess(const std::vector<Frame>& frames,
                           const PostureAnalysis& posture) const override;

    const Profile& profile() const { return profile_; }

private:
    Profile profile_;
};

class SkillAssessorRegistry {
public:
    SkillAssessorRegistry() = default;

    SkillAssessorRegistry(SkillAssessorRegistry&&) = default;
    SkillAssessorRegistry& operator=(SkillAssessorRegistry&&) = default;

    // Replaces any assessor already registered for the pair
    void registerAssessor(SportType sport, SkillType skill, std::unique_ptr<SkillAssessor> assessor);

    // Exact pair, then (sport, GENERAL), then the general assessor
    const SkillAssessor& find(SportType sport, SkillType skill) const;

    SkillAssessment assess(SportType sport, SkillType skill,
                           const std::vector<Frame>& frames,
                           const PostureAnalysis& posture) const;

    size_t size() const { return assessors_.size(); }

    // Registry with every built-in sport/skill variant
    static SkillAssessorRegistry withDefaults();

private:
    std::map<std::pair<SportType, SkillType>, std::unique_ptr<SkillAssessor>> assessors_;
    GeneralSkillAssessor general_;
};

} // namespace formcheck

#endif // SKILL_ASSESSOR_HPP
