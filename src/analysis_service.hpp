#ifndef ANALYSIS_SERVICE_HPP
#define ANALYSIS_SERVICE_HPP

#include "analysis_pipeline.hpp"
#include "video_source.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <memory>

namespace formcheck {

// Runs pipeline invocations on a worker pool with a per-invocation deadline.
// Work that misses the deadline keeps running on its worker and cleans up
// after itself; the caller gets the timed-out result immediately. Work still
// queued when its deadline passes is dropped without opening the video.
class AnalysisService {
public:
    // A zero or negative deadline waits indefinitely
    AnalysisService(std::shared_ptr<const AnalysisPipeline> pipeline,
                    size_t workers,
                    std::chrono::milliseconds deadline);

    // Throws DecodeError / VideoFetchError from the pipeline
    FormIntegrityResult analyze(const VideoReference& video, const AnalysisRequest& request);

    // Fail-open: never throws, returns the fail-open verdict on any error or timeout
    IntegrityVerdict checkIntegrity(const VideoReference& video, const AnalysisConfig& config);

    size_t workerCount() const { return pool_.threadCount(); }
    size_t pendingTasks() const { return pool_.pendingTasks(); }
    bool hasPoseEstimator() const { return pipeline_->hasPoseEstimator(); }
    std::chrono::milliseconds deadline() const { return deadline_; }

private:
    template<class T>
    bool waitForResult(std::future<T>& future) const;

    std::shared_ptr<const AnalysisPipeline> pipeline_;
    std::chrono::milliseconds deadline_;
    WorkerPool pool_;
};

} // namespace formcheck

#endif // ANALYSIS_SERVICE_HPP
