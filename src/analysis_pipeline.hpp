#ifndef ANALYSIS_PIPELINE_HPP
#define ANALYSIS_PIPELINE_HPP

#include "analysis_config.hpp"
#include "analysis_types.hpp"
#include "pose_estimator.hpp"
#include "optical_flow.hpp"
#include "skill_assessor.hpp"
#include "video_source.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace formcheck {

struct AnalysisRequest {
    SportType sport_type = SportType::GENERAL;
    SkillType skill_type = SkillType::GENERAL;
    std::optional<float> skill_score;   // Supplied by the caller, 0-100
    AnalysisConfig config;
};

enum class AnalysisStatus {
    COMPLETED = 0,
    TIMED_OUT = 1
};

std::string analysisStatusToString(AnalysisStatus status);

struct FormIntegrityResult {
    AnalysisStatus status;
    PostureAnalysis posture_analysis;
    SkillAssessment skill_assessment;
    std::optional<InjuryRiskPrediction> injury_risk_prediction;   // Absent on timeout
    IntegrityVerdict integrity_verdict;
    int frames_analyzed;
    SportType sport_type;
    SkillType skill_type;
    std::string analyzed_at;    // ISO-8601 UTC

    FormIntegrityResult()
        : status(AnalysisStatus::COMPLETED), frames_analyzed(0),
          sport_type(SportType::GENERAL), skill_type(SkillType::GENERAL) {}

    json toJson(bool include_keypoints = true) const;

    // Result reported when the deadline passes before the pipeline finishes
    static FormIntegrityResult timedOut(const AnalysisRequest& request);
};

std::string currentTimestampUtc();

// The single logical operation: posture, skill, injury risk and integrity
// for one video. Stateless between calls; safe to share across workers.
class AnalysisPipeline {
public:
    AnalysisPipeline(PoseEstimatorFactory pose_factory,
                     FlowEstimatorFactory flow_factory,
                     std::shared_ptr<const SkillAssessorRegistry> skills);

    // Throws DecodeError if the posture frames cannot be decoded
    FormIntegrityResult analyzeIntegrityAndForm(const VideoSource& source,
                                                const AnalysisRequest& request) const;

    // Never throws: any failure yields the fail-open verdict
    IntegrityVerdict runIntegrityCheck(const std::string& video_path,
                                       const AnalysisConfig& config) const;

    bool hasPoseEstimator() const { return static_cast<bool>(pose_factory_); }

private:
    PostureAnalysis analyzePosture(const std::vector<Frame>& frames) const;
    IntegrityVerdict checkIntegrity(const std::string& video_path, const AnalysisConfig& config) const;

    PoseEstimatorFactory pose_factory_;
    FlowEstimatorFactory flow_factory_;
    std::shared_ptr<const SkillAssessorRegistry> skills_;
};

} // namespace formcheck

#endif // ANALYSIS_PIPELINE_HPP
