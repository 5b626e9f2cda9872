#include "integrity_verdict.hpp"
#include "test_support.hpp"

using namespace formcheck;
using namespace formcheck::testing;

int main() {
    std::cout << "=== Integrity Verdict Test ===" << std::endl;

    IntegrityVerdictComposer composer;

    SimilarityReport duplication;
    duplication.is_duplicated = false;
    duplication.confidence = 0.05f;
    duplication.duplicate_count = 1;
    duplication.anomalies = {"Frames 6 and 7 are 100.0% similar"};

    MotionReport motion;
    motion.is_unnatural = true;
    motion.confidence = 0.1f;
    motion.anomalies = {"Unnatural movement detected between frames 9 and 10"};

    // Test 1: Logical OR with max confidence
    {
        IntegrityVerdict verdict = composer.compose(duplication, motion, 20);
        assert_true(verdict.is_cheating_detected, "motion anomaly alone detects cheating");
        assert_true(near(verdict.confidence, 0.1, 1e-6), "confidence is the larger component");
        assert_true(verdict.frames_analyzed == 20 && verdict.duplicate_frames == 1, "counts carried over");
        assert_true(verdict.detected_anomalies.size() == 2 &&
                    verdict.detected_anomalies[0] == duplication.anomalies[0] &&
                    verdict.detected_anomalies[1] == motion.anomalies[0],
                    "duplication anomalies come before motion anomalies");
        assert_true(verdict.isWellFormed(), "composed verdict is well formed");
    }

    // Test 2: Identical text in both lists is kept twice
    {
        SimilarityReport dup = duplication;
        MotionReport mot = motion;
        mot.anomalies = dup.anomalies;
        IntegrityVerdict verdict = composer.compose(dup, mot, 20);
        assert_true(verdict.detected_anomalies.size() == 2, "no deduplication across lists");
    }

    // Test 3: Nothing found
    {
        IntegrityVerdict verdict = composer.compose(SimilarityReport(), MotionReport(), 0);
        assert_true(!verdict.is_cheating_detected && near(verdict.confidence, 0.0), "empty reports give a clean verdict");
        assert_true(verdict.detected_anomalies.empty(), "no anomalies in a clean verdict");
        assert_true(verdict.isWellFormed(), "clean verdict is well formed");
    }

    // Test 4: Fail-open verdict
    {
        IntegrityVerdict verdict = IntegrityVerdictComposer::failOpenVerdict();
        assert_true(!verdict.is_cheating_detected, "fail-open never detects cheating");
        assert_true(near(verdict.confidence, 0.0), "fail-open confidence is 0");
        assert_true(verdict.detected_anomalies.size() == 1 && verdict.detected_anomalies[0] == "Analysis failed",
                    "fail-open carries one marker anomaly");
        assert_true(verdict.frames_analyzed == 0 && verdict.duplicate_frames == 0, "fail-open counts are 0");

        IntegrityVerdict parsed = IntegrityVerdict::fromJson(json::parse(verdict.toJson().dump()));
        assert_true(parsed.isWellFormed(), "fail-open verdict parses as well formed");
        assert_true(parsed.detected_anomalies == verdict.detected_anomalies, "fail-open anomalies survive parsing");
    }

    // Test 5: Malformed verdicts are rejected
    {
        json bad_confidence = IntegrityVerdictComposer::failOpenVerdict().toJson();
        bad_confidence["confidence"] = 1.5;
        bool threw = false;
        try {
            IntegrityVerdict::fromJson(bad_confidence);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert_true(threw, "confidence above 1 rejected");

        json too_many_duplicates = composer.compose(duplication, motion, 20).toJson();
        too_many_duplicates["duplicate_frames"] = 20;
        threw = false;
        try {
            IntegrityVerdict::fromJson(too_many_duplicates);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert_true(threw, "more duplicates than pairs rejected");

        json missing = composer.compose(duplication, motion, 20).toJson();
        missing.erase("detected_anomalies");
        threw = false;
        try {
            IntegrityVerdict::fromJson(missing);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert_true(threw, "missing field rejected");
    }

    return finish("Integrity Verdict");
}
