#include "motion_anomaly_detector.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace formcheck {

MotionAnomalyDetector::MotionAnomalyDetector(FlowEstimator& flow, double outlier_sigma)
    : flow_(flow), outlier_sigma_(outlier_sigma) {
}

std::vector<size_t> MotionAnomalyDetector::findOutliers(const std::vector<double>& values, double sigma,
                                                        double* mean_out, double* stddev_out) {
    std::vector<size_t> outliers;
    double mean = 0.0;
    double stddev = 0.0;

    if (!values.empty()) {
        // Population standard deviation
        cv::Scalar m, s;
        cv::meanStdDev(cv::Mat(values), m, s);
        mean = m[0];
        stddev = s[0];
    }

    if (mean_out) *mean_out = mean;
    if (stddev_out) *stddev_out = stddev;

    if (values.size() < 2 || stddev <= ZERO_STDDEV) {
        return outliers;
    }

    for (size_t i = 0; i < values.size(); ++i) {
        if (std::fabs(values[i] - mean) > sigma * stddev) {
            outliers.push_back(i);
        }
    }
    return outliers;
}

MotionReport MotionAnomalyDetector::detect(const std::vector<Frame>& frames) {
    MotionReport report;

    if (frames.size() < 2) {
        return report;
    }

    // Position i of each measured pair (frames i and i+1)
    std::vector<size_t> pair_positions;

    for (size_t i = 0; i + 1 < frames.size(); ++i) {
        try {
            double magnitude = flow_.meanMagnitude(frames[i].image, frames[i + 1].image);
            if (!std::isfinite(magnitude)) {
                std::cerr << "Non-finite flow magnitude between frames " << i << " and " << i + 1
                          << ", skipping pair" << std::endl;
                continue;
            }
            report.magnitudes.push_back(magnitude);
            pair_positions.push_back(i);
        } catch (const std::exception& e) {
            std::cerr << "Optical flow failed between frames " << i << " and " << i + 1
                      << ": " << e.what() << std::endl;
        }
    }

    std::vector<size_t> outliers = findOutliers(report.magnitudes, outlier_sigma_,
                                                &report.mean_magnitude, &report.stddev_magnitude);

    for (size_t outlier : outliers) {
        size_t position = pair_positions[outlier];
        report.anomalies.push_back("Unnatural movement detected between frames " +
                                   std::to_string(position) + " and " + std::to_string(position + 1));
    }

    report.is_unnatural = !report.anomalies.empty();
    if (!report.magnitudes.empty()) {
        double ratio = static_cast<double>(report.anomalies.size()) / report.magnitudes.size();
        report.confidence = static_cast<float>(std::min(ratio, 1.0));
    }

    if (report.is_unnatural) {
        std::cout << "Motion check: " << report.anomalies.size() << " outlier pairs (mean="
                  << report.mean_magnitude << ", stddev=" << report.stddev_magnitude << ")" << std::endl;
    }

    return report;
}

} // namespace formcheck
