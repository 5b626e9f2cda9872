#include "analysis_pipeline.hpp"
#include "analysis_errors.hpp"
#include "frame_sampler.hpp"
#include "posture_analyzer.hpp"
#include "duplication_detector.hpp"
#include "motion_anomaly_detector.hpp"
#include "injury_risk_scorer.hpp"
#include "integrity_verdict.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iostream>

namespace formcheck {

std::string analysisStatusToString(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::COMPLETED: return "completed";
        case AnalysisStatus::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

std::string currentTimestampUtc() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

json FormIntegrityResult::toJson(bool include_keypoints) const {
    json j;
    j["status"] = analysisStatusToString(status);
    j["posture_analysis"] = posture_analysis.toJson(include_keypoints);
    j["skill_assessment"] = skill_assessment.toJson();
    j["injury_risk_prediction"] = injury_risk_prediction.has_value()
        ? injury_risk_prediction->toJson()
        : json(nullptr);
    j["integrity_verdict"] = integrity_verdict.toJson();
    j["frames_analyzed"] = frames_analyzed;
    j["sport_type"] = sportTypeToString(sport_type);
    j["skill_type"] = skillTypeToString(skill_type);
    j["analyzed_at"] = analyzed_at;
    return j;
}

FormIntegrityResult FormIntegrityResult::timedOut(const AnalysisRequest& request) {
    FormIntegrityResult result;
    result.status = AnalysisStatus::TIMED_OUT;
    result.integrity_verdict = IntegrityVerdictComposer::failOpenVerdict();
    result.sport_type = request.sport_type;
    result.skill_type = request.skill_type;
    result.analyzed_at = currentTimestampUtc();
    return result;
}

AnalysisPipeline::AnalysisPipeline(PoseEstimatorFactory pose_factory,
                                   FlowEstimatorFactory flow_factory,
                                   std::shared_ptr<const SkillAssessorRegistry> skills)
    : pose_factory_(std::move(pose_factory)),
      flow_factory_(std::move(flow_factory)),
      skills_(std::move(skills)) {
    if (!flow_factory_) {
        flow_factory_ = FarnebackFlowEstimator::factory();
    }
    if (!skills_) {
        skills_ = std::make_shared<SkillAssessorRegistry>(SkillAssessorRegistry::withDefaults());
    }
}

PostureAnalysis AnalysisPipeline::analyzePosture(const std::vector<Frame>& frames) const {
    std::unique_ptr<PoseEstimator> estimator;
    if (pose_factory_) {
        try {
            estimator = pose_factory_();
        } catch (const std::exception& e) {
            std::cerr << "Failed to create pose estimator: " << e.what() << std::endl;
        }
    }

    if (!estimator) {
        std::cerr << "No pose estimator available, posture analysis skipped" << std::endl;
        PostureAnalysis empty;
        empty.frames_analyzed = static_cast<int>(frames.size());
        return empty;
    }

    PostureAnalyzer analyzer(*estimator);
    return analyzer.analyze(frames);
}

IntegrityVerdict AnalysisPipeline::checkIntegrity(const std::string& video_path,
                                                  const AnalysisConfig& config) const {
    FrameSampler sampler(config.integritySampling());
    std::vector<Frame> frames = sampler.sample(video_path);

    DuplicationDetector duplication(config.duplicate_similarity_threshold, config.duplicate_rate_threshold);
    SimilarityReport similarity = duplication.detect(frames);

    std::unique_ptr<FlowEstimator> flow = flow_factory_();
    if (!flow) {
        throw IntegrityCheckFailure("no optical flow estimator available");
    }
    MotionAnomalyDetector motion_detector(*flow, config.motion_outlier_sigma);
    MotionReport motion = motion_detector.detect(frames);

    IntegrityVerdictComposer composer;
    return composer.compose(similarity, motion, static_cast<int>(frames.size()));
}

IntegrityVerdict AnalysisPipeline::runIntegrityCheck(const std::string& video_path,
                                                     const AnalysisConfig& config) const {
    try {
        IntegrityVerdict verdict = checkIntegrity(video_path, config);
        std::cout << "Integrity check: frames=" << verdict.frames_analyzed
                  << ", duplicates=" << verdict.duplicate_frames
                  << ", cheating=" << (verdict.is_cheating_detected ? "true" : "false")
                  << ", confidence=" << verdict.confidence << std::endl;
        return verdict;
    } catch (const std::exception& e) {
        std::cerr << "Integrity check failed: " << e.what() << std::endl;
        return IntegrityVerdictComposer::failOpenVerdict();
    }
}

FormIntegrityResult AnalysisPipeline::analyzeIntegrityAndForm(const VideoSource& source,
                                                              const AnalysisRequest& request) const {
    FormIntegrityResult result;
    result.sport_type = request.sport_type;
    result.skill_type = request.skill_type;

    FrameSampler posture_sampler(request.config.postureSampling());
    std::vector<Frame> posture_frames = posture_sampler.sample(source.path());
    result.frames_analyzed = static_cast<int>(posture_frames.size());

    result.posture_analysis = analyzePosture(posture_frames);

    result.skill_assessment = skills_->assess(request.sport_type, request.skill_type,
                                              posture_frames, result.posture_analysis);
    if (request.skill_score.has_value()) {
        result.skill_assessment.score = std::clamp(*request.skill_score, 0.0f, 100.0f);
    }

    InjuryRiskScorer risk_scorer;
    result.injury_risk_prediction = risk_scorer.score(result.posture_analysis, result.skill_assessment.score);

    // Posture frames are no longer needed once the integrity pass starts
    posture_frames.clear();
    posture_frames.shrink_to_fit();

    result.integrity_verdict = runIntegrityCheck(source.path(), request.config);
    result.status = AnalysisStatus::COMPLETED;
    result.analyzed_at = currentTimestampUtc();

    std::cout << "Analysis complete: frames=" << result.frames_analyzed
              << ", posture=" << result.posture_analysis.posture_score
              << ", risk=" << riskLevelToString(result.injury_risk_prediction->risk_level)
              << ", cheating=" << (result.integrity_verdict.is_cheating_detected ? "true" : "false")
              << std::endl;

    return result;
}

} // namespace formcheck
