#include "motion_anomaly_detector.hpp"
#include "test_support.hpp"
#include <limits>

using namespace formcheck;
using namespace formcheck::testing;

namespace {

std::vector<Frame> grayFrames(size_t count) {
    std::vector<cv::Mat> images(count, uniformGray(cv::Size(32, 32), 100));
    return toFrames(images);
}

cv::Mat texturedFrame(cv::Size size) {
    cv::Mat noise(size, CV_8UC1);
    cv::RNG rng(12345);
    rng.fill(noise, cv::RNG::UNIFORM, 0, 256);
    cv::Mat smooth;
    cv::GaussianBlur(noise, smooth, cv::Size(7, 7), 2.0);
    return smooth;
}

} // namespace

int main() {
    std::cout << "=== Motion Anomaly Detector Test ===" << std::endl;

    // Test 1: One spike among steady motion is flagged at its pair position
    {
        ScriptedFlowEstimator flow({1, 1, 1, 1, 1, 1, 1, 1, 1, 10});
        MotionAnomalyDetector detector(flow);
        MotionReport report = detector.detect(grayFrames(11));

        assert_true(report.magnitudes.size() == 10, "ten pairs measured");
        assert_true(report.is_unnatural, "spike marks motion unnatural");
        assert_true(report.anomalies.size() == 1, "exactly one outlier");
        assert_true(report.anomalies[0] == "Unnatural movement detected between frames 9 and 10",
                    "anomaly names the spiking pair");
        assert_true(near(report.confidence, 0.1, 1e-6), "confidence is 1/10");
        assert_true(near(report.mean_magnitude, 1.9, 1e-9), "mean magnitude 1.9");
        assert_true(near(report.stddev_magnitude, 2.7, 1e-9), "population stddev 2.7");
    }

    // Test 2: Zero variance yields no anomalies
    {
        ScriptedFlowEstimator flow({3.5});
        MotionAnomalyDetector detector(flow);
        MotionReport report = detector.detect(grayFrames(8));
        assert_true(report.anomalies.empty() && !report.is_unnatural, "constant magnitudes give no anomalies");
        assert_true(near(report.confidence, 0.0), "confidence 0 with no anomalies");
    }

    // Test 3: Constant content through the real flow primitive
    {
        FarnebackFlowEstimator flow;
        MotionAnomalyDetector detector(flow);
        MotionReport report = detector.detect(grayFrames(6));
        bool all_zero = true;
        for (double m : report.magnitudes) {
            all_zero = all_zero && near(m, 0.0, 1e-6);
        }
        assert_true(report.magnitudes.size() == 5, "five pairs measured on six frames");
        assert_true(all_zero, "constant frames have zero flow");
        assert_true(report.anomalies.empty(), "constant frames have no anomalies");
    }

    // Test 4: Fewer than two frames means no pairs
    {
        ScriptedFlowEstimator flow({1.0});
        MotionAnomalyDetector detector(flow);
        MotionReport empty = detector.detect({});
        MotionReport single = detector.detect(grayFrames(1));
        assert_true(!empty.is_unnatural && near(empty.confidence, 0.0), "empty input reports nothing");
        assert_true(!single.is_unnatural && near(single.confidence, 0.0) && single.magnitudes.empty(),
                    "single frame reports nothing");
    }

    // Test 5: A failing pair is skipped and positions are preserved
    {
        double fail = std::numeric_limits<double>::quiet_NaN();
        ScriptedFlowEstimator flow({fail, 1, 1, 1, 1, 1, 1, 1, 1, 1, 10});
        MotionAnomalyDetector detector(flow);
        MotionReport report = detector.detect(grayFrames(12));
        assert_true(report.magnitudes.size() == 10, "failed pair not measured");
        assert_true(report.anomalies.size() == 1 &&
                    report.anomalies[0] == "Unnatural movement detected between frames 10 and 11",
                    "anomaly keeps the source pair position");
    }

    // Test 6: Outlier helper
    {
        assert_true(MotionAnomalyDetector::findOutliers({1.0, 5.0}, 2.0).empty(), "two values cannot exceed 2 sigma");
        assert_true(MotionAnomalyDetector::findOutliers({4.0}, 2.0).empty(), "single value has no outliers");
        assert_true(MotionAnomalyDetector::findOutliers({}, 2.0).empty(), "no values, no outliers");

        std::vector<size_t> loose = MotionAnomalyDetector::findOutliers({1, 1, 1, 1, 1, 1, 1, 1, 1, 10}, 1.0);
        assert_true(loose.size() == 1 && loose[0] == 9, "configurable sigma");
    }

    // Test 7: Real flow sees a translated texture
    {
        cv::Mat base = texturedFrame(cv::Size(96, 96));
        cv::Mat shifted;
        cv::Mat transform = (cv::Mat_<double>(2, 3) << 1, 0, 3, 0, 1, 0);
        cv::warpAffine(base, shifted, transform, base.size(), cv::INTER_LINEAR, cv::BORDER_REFLECT);

        FarnebackFlowEstimator flow;
        double magnitude = flow.meanMagnitude(base, shifted);
        assert_true(magnitude > 0.5, "translated texture has measurable flow");
        assert_true(near(flow.meanMagnitude(base, base), 0.0, 1e-6), "identical frames have no flow");
    }

    return finish("Motion Anomaly Detector");
}
