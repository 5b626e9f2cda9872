#ifndef DUPLICATION_DETECTOR_HPP
#define DUPLICATION_DETECTOR_HPP

#include "analysis_types.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace formcheck {

// Flags consecutive frames that are near-identical by grayscale histogram
class DuplicationDetector {
public:
    static constexpr double DEFAULT_SIMILARITY_THRESHOLD = 0.95;
    static constexpr double DEFAULT_RATE_THRESHOLD = 0.10;
    static constexpr int HISTOGRAM_BINS = 256;

    DuplicationDetector(double similarity_threshold = DEFAULT_SIMILARITY_THRESHOLD,
                        double rate_threshold = DEFAULT_RATE_THRESHOLD);

    // Frames must be single-channel 8-bit. Throws IntegrityCheckFailure otherwise.
    SimilarityReport detect(const std::vector<Frame>& frames) const;

    // Histogram correlation in [0, 1]; negative correlation is reported as 0
    static double similarity(const cv::Mat& a, const cv::Mat& b);

private:
    static cv::Mat normalizedHistogram(const cv::Mat& gray);

    double similarity_threshold_;
    double rate_threshold_;
};

} // namespace formcheck

#endif // DUPLICATION_DETECTOR_HPP
