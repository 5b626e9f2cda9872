#ifndef ANALYSIS_ERRORS_HPP
#define ANALYSIS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace formcheck {

// Video could not be opened or decoded. Fatal to the analysis run.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

// Video reference could not be downloaded or its inline payload decoded
class VideoFetchError : public std::runtime_error {
public:
    explicit VideoFetchError(const std::string& message) : std::runtime_error(message) {}
};

// Pose estimation or optical flow failed on a single frame or frame pair.
// Callers skip the affected frame/pair and keep going.
class PrimitiveFailure : public std::runtime_error {
public:
    explicit PrimitiveFailure(const std::string& message) : std::runtime_error(message) {}
};

// Raised inside the duplication/motion stage. Always converted to the
// fail-open integrity verdict before it reaches the caller.
class IntegrityCheckFailure : public std::runtime_error {
public:
    explicit IntegrityCheckFailure(const std::string& message) : std::runtime_error(message) {}
};

} // namespace formcheck

#endif // ANALYSIS_ERRORS_HPP
