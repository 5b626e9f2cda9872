#include "posture_analyzer.hpp"
#include "test_support.hpp"

using namespace formcheck;
using namespace formcheck::testing;

int main() {
    std::cout << "=== Posture Analyzer Test ===" << std::endl;

    std::vector<Frame> three_frames = toFrames({
        uniformFrame(cv::Size(32, 32), 10),
        uniformFrame(cv::Size(32, 32), 20),
        uniformFrame(cv::Size(32, 32), 30)
    });

    // Test 1: Balanced body keeps the base score
    {
        PostureMetrics metrics = PostureAnalyzer::scoreLandmarks(balancedLandmarks());
        assert_true(near(metrics.score, 85.0), "balanced landmarks score 85");
        assert_true(metrics.issues.empty(), "balanced landmarks have no issues");
    }

    // Test 2: Each imbalance applies its own penalty
    {
        PostureMetrics shoulders = PostureAnalyzer::scoreLandmarks(makeLandmarks(0.30f, 0.40f, 0.55f, 0.55f, 0.75f, 0.75f));
        assert_true(near(shoulders.score, 75.0), "shoulder imbalance costs 10");
        assert_true(shoulders.issues.count(AlignmentIssue::SHOULDER_IMBALANCE) == 1, "shoulder issue tagged");

        PostureMetrics knees = PostureAnalyzer::scoreLandmarks(makeLandmarks(0.30f, 0.30f, 0.55f, 0.55f, 0.70f, 0.80f));
        assert_true(near(knees.score, 77.0), "knee imbalance costs 8");

        PostureMetrics all = PostureAnalyzer::scoreLandmarks(makeLandmarks(0.20f, 0.40f, 0.50f, 0.60f, 0.70f, 0.80f));
        assert_true(near(all.score, 57.0), "all three imbalances score 57");
        assert_true(all.issues.size() == 3, "all three issues tagged");
    }

    // Test 3: Offsets below the threshold are not flagged
    {
        PostureMetrics metrics = PostureAnalyzer::scoreLandmarks(makeLandmarks(0.30f, 0.34f, 0.55f, 0.52f, 0.75f, 0.79f));
        assert_true(near(metrics.score, 85.0), "offsets of 0.04 or less are tolerated");
    }

    // Test 4: A pair with a missing side contributes nothing
    {
        LandmarkSet partial;
        partial.points.emplace_back(landmark_names::LEFT_SHOULDER, 0.4f, 0.30f, 0.0f);
        partial.points.emplace_back(landmark_names::LEFT_HIP, 0.4f, 0.50f, 0.0f);
        partial.points.emplace_back(landmark_names::RIGHT_HIP, 0.6f, 0.60f, 0.0f);
        PostureMetrics metrics = PostureAnalyzer::scoreLandmarks(partial);
        assert_true(near(metrics.score, 75.0), "only the complete hip pair is scored");
        assert_true(metrics.issues.size() == 1, "one issue from the complete pair");
    }

    // Test 5: Aggregate is the mean over frames with landmarks
    {
        ScriptedPoseEstimator estimator({
            ScriptedPoseEstimator::found(balancedLandmarks()),
            ScriptedPoseEstimator::nobody(),
            ScriptedPoseEstimator::found(makeLandmarks(0.20f, 0.40f, 0.50f, 0.60f, 0.70f, 0.80f))
        });
        PostureAnalyzer analyzer(estimator);
        PostureAnalysis analysis = analyzer.analyze(three_frames);

        assert_true(near(analysis.posture_score, 71.0), "mean of 85 and 57 is 71");
        assert_true(analysis.frames_analyzed == 3, "every offered frame is counted");
        assert_true(analysis.frames_with_landmarks == 2, "two frames contributed");
        assert_true(analysis.keypoints.size() == 2, "keypoints kept per contributing frame");
        assert_true(analysis.recommended_corrections.size() == 3, "one correction per issue");

        std::vector<std::string> issues = analysis.issueStrings();
        assert_true(issues.size() == 3 &&
                    issues[0] == "Shoulder imbalance detected" &&
                    issues[1] == "Hip imbalance detected" &&
                    issues[2] == "Knee imbalance detected",
                    "issue tags reported in fixed order");
    }

    // Test 6: Repeated issues collapse into one tag
    {
        ScriptedPoseEstimator estimator({
            ScriptedPoseEstimator::found(makeLandmarks(0.30f, 0.40f, 0.55f, 0.55f, 0.75f, 0.75f))
        });
        PostureAnalyzer analyzer(estimator);
        PostureAnalysis analysis = analyzer.analyze(three_frames);
        assert_true(analysis.alignment_issues.size() == 1, "shoulder issue appears once across frames");
        assert_true(near(analysis.posture_score, 75.0), "score is 75 on every frame");
    }

    // Test 7: No landmarks anywhere yields zero and no issues
    {
        ScriptedPoseEstimator estimator({ScriptedPoseEstimator::nobody()});
        PostureAnalyzer analyzer(estimator);
        PostureAnalysis analysis = analyzer.analyze(three_frames);
        assert_true(near(analysis.posture_score, 0.0), "score is 0 without landmarks");
        assert_true(analysis.alignment_issues.empty(), "issue set empty without landmarks");
        assert_true(analysis.frames_analyzed == 3, "frames still counted without landmarks");
    }

    // Test 8: Estimator failures skip the frame without aborting
    {
        ScriptedPoseEstimator estimator({
            ScriptedPoseEstimator::failure(),
            ScriptedPoseEstimator::found(balancedLandmarks())
        });
        PostureAnalyzer analyzer(estimator);
        PostureAnalysis analysis = analyzer.analyze(three_frames);
        assert_true(analysis.frames_with_landmarks == 2, "failed frame skipped");
        assert_true(analysis.frames_analyzed == 3, "failed frame still counted");
        assert_true(near(analysis.posture_score, 85.0), "score unaffected by the failed frame");
    }

    // Test 9: Empty and single-frame input
    {
        ScriptedPoseEstimator estimator({ScriptedPoseEstimator::found(balancedLandmarks())});
        PostureAnalyzer analyzer(estimator);

        PostureAnalysis empty = analyzer.analyze({});
        assert_true(empty.frames_analyzed == 0 && near(empty.posture_score, 0.0), "empty input gives zero result");

        PostureAnalysis single = analyzer.analyze(toFrames({uniformFrame(cv::Size(16, 16), 0)}));
        assert_true(single.frames_with_landmarks == 1 && near(single.posture_score, 85.0), "single frame is well defined");
    }

    // Test 10: JSON shape
    {
        ScriptedPoseEstimator estimator({ScriptedPoseEstimator::found(balancedLandmarks())});
        PostureAnalyzer analyzer(estimator);
        json j = analyzer.analyze(three_frames).toJson();
        assert_true(j.contains("posture_score") && j.contains("alignment_issues") && j.contains("keypoints"),
                    "posture JSON has the documented fields");
        assert_true(j["keypoints"].size() == 3 && j["keypoints"][0].size() == 6, "keypoints serialized per frame");
    }

    return finish("Posture Analyzer");
}
