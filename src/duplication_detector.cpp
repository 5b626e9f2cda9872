#include "duplication_detector.hpp"
#include "analysis_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>
#include <iostream>

namespace formcheck {

DuplicationDetector::DuplicationDetector(double similarity_threshold, double rate_threshold)
    : similarity_threshold_(similarity_threshold), rate_threshold_(rate_threshold) {
}

cv::Mat DuplicationDetector::normalizedHistogram(const cv::Mat& gray) {
    if (gray.empty() || gray.type() != CV_8UC1) {
        throw IntegrityCheckFailure("duplication check expects 8-bit grayscale frames");
    }

    int channels[] = {0};
    int hist_size[] = {HISTOGRAM_BINS};
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::Mat hist;
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
    cv::normalize(hist, hist, 0.0, 1.0, cv::NORM_MINMAX);
    return hist;
}

double DuplicationDetector::similarity(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat hist_a = normalizedHistogram(a);
    cv::Mat hist_b = normalizedHistogram(b);
    double correlation = cv::compareHist(hist_a, hist_b, cv::HISTCMP_CORREL);
    return std::clamp(correlation, 0.0, 1.0);
}

SimilarityReport DuplicationDetector::detect(const std::vector<Frame>& frames) const {
    SimilarityReport report;

    if (frames.size() < 2) {
        return report;
    }

    for (size_t i = 1; i < frames.size(); ++i) {
        double sim = similarity(frames[i - 1].image, frames[i].image);
        if (sim > similarity_threshold_) {
            report.duplicate_count++;

            char message[96];
            std::snprintf(message, sizeof(message), "Frames %zu and %zu are %.1f%% similar",
                          i - 1, i, sim * 100.0);
            report.anomalies.push_back(message);
        }
    }

    double rate = static_cast<double>(report.duplicate_count) / static_cast<double>(frames.size());
    report.is_duplicated = rate > rate_threshold_;
    report.confidence = static_cast<float>(std::min(rate, 1.0));

    if (report.duplicate_count > 0) {
        std::cout << "Duplication check: " << report.duplicate_count << " near-identical pairs in "
                  << frames.size() << " frames" << std::endl;
    }

    return report;
}

} // namespace formcheck
