#include "integrity_verdict.hpp"
#include <algorithm>

namespace formcheck {

IntegrityVerdict IntegrityVerdictComposer::compose(const SimilarityReport& duplication,
                                                   const MotionReport& motion,
                                                   int frames_analyzed) const {
    IntegrityVerdict verdict;
    verdict.is_cheating_detected = duplication.is_duplicated || motion.is_unnatural;
    verdict.confidence = std::clamp(std::max(duplication.confidence, motion.confidence), 0.0f, 1.0f);
    verdict.frames_analyzed = frames_analyzed;
    verdict.duplicate_frames = duplication.duplicate_count;

    // Both lists are kept in full, duplication first
    verdict.detected_anomalies.reserve(duplication.anomalies.size() + motion.anomalies.size());
    verdict.detected_anomalies.insert(verdict.detected_anomalies.end(),
                                      duplication.anomalies.begin(), duplication.anomalies.end());
    verdict.detected_anomalies.insert(verdict.detected_anomalies.end(),
                                      motion.anomalies.begin(), motion.anomalies.end());
    return verdict;
}

IntegrityVerdict IntegrityVerdictComposer::failOpenVerdict() {
    IntegrityVerdict verdict;
    verdict.is_cheating_detected = false;
    verdict.confidence = 0.0f;
    verdict.detected_anomalies = {"Analysis failed"};
    verdict.frames_analyzed = 0;
    verdict.duplicate_frames = 0;
    return verdict;
}

} // namespace formcheck
