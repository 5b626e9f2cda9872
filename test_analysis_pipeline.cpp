#include "analysis_pipeline.hpp"
#include "analysis_errors.hpp"
#include "test_support.hpp"

using namespace formcheck;
using namespace formcheck::testing;

namespace {

// 101 flat frames with distinct gray levels; frame 51 repeats frame 50
void writeSyntheticClip(const std::string& path) {
    std::vector<cv::Mat> frames;
    for (int i = 0; i < 101; ++i) {
        frames.push_back(uniformFrame(cv::Size(64, 64), 20 + (i * 37) % 200));
    }
    frames[51] = frames[50].clone();
    writeVideo(path, frames, 30.0);
}

AnalysisRequest clipRequest() {
    AnalysisRequest request;
    request.config.frame_stride_integrity = 1;
    request.config.resolution_integrity = cv::Size(64, 64);
    request.config.resolution_posture = cv::Size(64, 64);
    return request;
}

} // namespace

int main() {
    std::cout << "=== Analysis Pipeline Test ===" << std::endl;

    ScopedFile clip(tempPath("pipeline.avi"));
    writeSyntheticClip(clip.path());

    AnalysisPipeline pipeline(
        scriptedPoseFactory({ScriptedPoseEstimator::found(balancedLandmarks())}),
        FarnebackFlowEstimator::factory(),
        nullptr);

    // Test 1: End-to-end on the synthetic clip
    {
        FormIntegrityResult result = pipeline.analyzeIntegrityAndForm(VideoSource::fromFile(clip.path()), clipRequest());

        assert_true(result.status == AnalysisStatus::COMPLETED, "analysis completed");
        assert_true(result.frames_analyzed == 11, "101 frames at stride 10 give 11 posture frames");
        assert_true(result.posture_analysis.frames_with_landmarks == 11, "every posture frame had landmarks");
        assert_true(near(result.posture_analysis.posture_score, 85.0), "balanced posture scores 85");
        assert_true(near(result.skill_assessment.score, 78.0), "general skill assessment used");
        assert_true(result.injury_risk_prediction.has_value(), "injury risk present");
        assert_true(result.injury_risk_prediction->risk_level == RiskLevel::LOW, "healthy clip is low risk");

        const IntegrityVerdict& verdict = result.integrity_verdict;
        assert_true(verdict.frames_analyzed == 101, "integrity pass sampled every frame");
        assert_true(verdict.duplicate_frames == 1, "one duplicate pair found");
        assert_true(verdict.confidence > 0.0f, "duplication confidence above 0");
        assert_true(verdict.detected_anomalies.size() == 1, "exactly one anomaly");
        assert_true(!verdict.detected_anomalies.empty() &&
                    verdict.detected_anomalies[0] == "Frames 50 and 51 are 100.0% similar",
                    "anomaly references frames 50 and 51");
        assert_true(!verdict.is_cheating_detected, "one duplicate in 101 frames is not cheating");
        assert_true(verdict.isWellFormed(), "verdict is well formed");

        json j = result.toJson();
        assert_true(j["status"] == "completed" && j["sport_type"] == "general", "result JSON metadata");
        assert_true(j["analyzed_at"].get<std::string>().size() == 20, "analyzed_at is an ISO-8601 UTC stamp");
        assert_true(j["injury_risk_prediction"].is_object(), "injury risk serialized");
    }

    // Test 2: Caller-supplied skill score drives the risk and is clamped
    {
        AnalysisPipeline slouching(
            scriptedPoseFactory({ScriptedPoseEstimator::found(makeLandmarks(0.20f, 0.40f, 0.50f, 0.60f, 0.70f, 0.80f))}),
            FarnebackFlowEstimator::factory(),
            nullptr);

        AnalysisRequest high_skill = clipRequest();
        high_skill.skill_score = 150.0f;
        FormIntegrityResult clamped = slouching.analyzeIntegrityAndForm(VideoSource::fromFile(clip.path()), high_skill);
        assert_true(near(clamped.skill_assessment.score, 100.0), "skill score clamped to 100");
        assert_true(near(clamped.posture_analysis.posture_score, 57.0), "slouching posture scores 57");
        assert_true(near(clamped.injury_risk_prediction->risk_score, 0.8, 1e-9), "issues and low posture give 0.8");
        assert_true(clamped.injury_risk_prediction->risk_level == RiskLevel::HIGH, "0.8 is high risk");

        AnalysisRequest low_skill = clipRequest();
        low_skill.skill_score = 40.0f;
        FormIntegrityResult risky = slouching.analyzeIntegrityAndForm(VideoSource::fromFile(clip.path()), low_skill);
        assert_true(near(risky.injury_risk_prediction->risk_score, 0.9, 1e-9), "low skill score adds 0.1");
    }

    // Test 3: Sport variants are dispatched
    {
        AnalysisRequest request = clipRequest();
        request.sport_type = SportType::BASKETBALL;
        request.skill_type = SkillType::SHOOTING;
        FormIntegrityResult result = pipeline.analyzeIntegrityAndForm(VideoSource::fromFile(clip.path()), request);
        assert_true(result.toJson()["skill_type"] == "shooting", "skill type echoed");
        assert_true(result.skill_assessment.feedback != "Good form overall. Focus on follow-through and balance.",
                    "basketball shooting assessor used");
    }

    // Test 4: Missing pose model still produces a result
    {
        AnalysisPipeline blind(PoseEstimatorFactory(), FarnebackFlowEstimator::factory(), nullptr);
        assert_true(!blind.hasPoseEstimator(), "pipeline reports missing estimator");
        FormIntegrityResult result = blind.analyzeIntegrityAndForm(VideoSource::fromFile(clip.path()), clipRequest());
        assert_true(result.posture_analysis.frames_analyzed == 11, "posture frames still counted");
        assert_true(result.posture_analysis.frames_with_landmarks == 0 &&
                    near(result.posture_analysis.posture_score, 0.0), "empty posture analysis");
        assert_true(result.integrity_verdict.duplicate_frames == 1, "integrity unaffected");
    }

    // Test 5: Undecodable sources
    {
        bool threw = false;
        try {
            pipeline.analyzeIntegrityAndForm(VideoSource::fromFile(tempPath("missing.avi")), clipRequest());
        } catch (const DecodeError&) {
            threw = true;
        }
        assert_true(threw, "analysis of a missing file raises DecodeError");

        IntegrityVerdict verdict = pipeline.runIntegrityCheck(tempPath("missing.avi"), AnalysisConfig());
        assert_true(verdict.detected_anomalies.size() == 1 && verdict.detected_anomalies[0] == "Analysis failed",
                    "integrity check of a missing file fails open");
        assert_true(!verdict.is_cheating_detected && verdict.isWellFormed(), "fail-open verdict is well formed");
    }

    // Test 6: Integrity check alone honours its stride
    {
        AnalysisConfig config;
        config.frame_stride_integrity = 5;
        config.resolution_integrity = cv::Size(32, 32);
        IntegrityVerdict verdict = pipeline.runIntegrityCheck(clip.path(), config);
        assert_true(verdict.frames_analyzed == 21, "101 frames at stride 5 give 21 frames");
        assert_true(verdict.duplicate_frames == 0, "strided sampling skips the duplicate pair");
    }

    // Test 7: Timed-out result shape
    {
        FormIntegrityResult timed_out = FormIntegrityResult::timedOut(clipRequest());
        json j = timed_out.toJson();
        assert_true(j["status"] == "timed_out", "timed-out status");
        assert_true(j["injury_risk_prediction"].is_null(), "no injury risk on timeout");
        assert_true(j["integrity_verdict"]["detected_anomalies"][0] == "Analysis failed", "fail-open verdict on timeout");
    }

    return finish("Analysis Pipeline");
}
