#ifndef POSTURE_ANALYZER_HPP
#define POSTURE_ANALYZER_HPP

#include "analysis_types.hpp"
#include "pose_estimator.hpp"
#include <vector>
#include <string>

namespace formcheck {

// Scores left/right symmetry of shoulders, hips and knees per frame and
// aggregates it over a clip.
class PostureAnalyzer {
public:
    static constexpr float BASE_SCORE = 85.0f;
    static constexpr float SHOULDER_PENALTY = 10.0f;
    static constexpr float HIP_PENALTY = 10.0f;
    static constexpr float KNEE_PENALTY = 8.0f;
    static constexpr float IMBALANCE_THRESHOLD = 0.05f;   // Normalized vertical offset

    explicit PostureAnalyzer(PoseEstimator& estimator);

    // Frames must be RGB. Frames where the estimator finds nobody, or throws,
    // are skipped but still counted in frames_analyzed.
    PostureAnalysis analyze(const std::vector<Frame>& frames);

    // Pure per-frame score from a landmark set
    static PostureMetrics scoreLandmarks(const LandmarkSet& landmarks);

    static std::string correctionFor(AlignmentIssue issue);

private:
    PoseEstimator& estimator_;
};

} // namespace formcheck

#endif // POSTURE_ANALYZER_HPP
