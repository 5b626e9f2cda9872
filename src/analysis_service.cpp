#include "analysis_service.hpp"
#include "integrity_verdict.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace formcheck {

AnalysisService::AnalysisService(std::shared_ptr<const AnalysisPipeline> pipeline,
                                 size_t workers,
                                 std::chrono::milliseconds deadline)
    : pipeline_(std::move(pipeline)), deadline_(deadline), pool_(workers) {
    std::cout << "Analysis service started with " << pool_.threadCount() << " workers, deadline "
              << (deadline_.count() > 0 ? std::to_string(deadline_.count()) + "ms" : std::string("none"))
              << std::endl;
}

template<class T>
bool AnalysisService::waitForResult(std::future<T>& future) const {
    if (deadline_.count() <= 0) {
        future.wait();
        return true;
    }
    return future.wait_for(deadline_) == std::future_status::ready;
}

FormIntegrityResult AnalysisService::analyze(const VideoReference& video, const AnalysisRequest& request) {
    std::shared_ptr<const AnalysisPipeline> pipeline = pipeline_;

    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    // The task owns copies of everything it touches
    auto future = pool_.submit([pipeline, video, request, abandoned]() {
        if (abandoned->load()) {
            return FormIntegrityResult::timedOut(request);
        }
        VideoSource source = VideoSource::open(video);
        return pipeline->analyzeIntegrityAndForm(source, request);
    });

    if (!waitForResult(future)) {
        abandoned->store(true);
        std::cerr << "Analysis exceeded deadline of " << deadline_.count()
                  << "ms, returning timed-out result" << std::endl;
        return FormIntegrityResult::timedOut(request);
    }

    return future.get();
}

IntegrityVerdict AnalysisService::checkIntegrity(const VideoReference& video, const AnalysisConfig& config) {
    std::shared_ptr<const AnalysisPipeline> pipeline = pipeline_;

    auto abandoned = std::make_shared<std::atomic<bool>>(false);

    try {
        auto future = pool_.submit([pipeline, video, config, abandoned]() {
            if (abandoned->load()) {
                return IntegrityVerdictComposer::failOpenVerdict();
            }
            VideoSource source = VideoSource::open(video);
            return pipeline->runIntegrityCheck(source.path(), config);
        });

        if (!waitForResult(future)) {
            abandoned->store(true);
            std::cerr << "Integrity check exceeded deadline of " << deadline_.count()
                      << "ms, failing open" << std::endl;
            return IntegrityVerdictComposer::failOpenVerdict();
        }

        return future.get();

    } catch (const std::exception& e) {
        std::cerr << "Integrity check could not run: " << e.what() << std::endl;
        return IntegrityVerdictComposer::failOpenVerdict();
    }
}

} // namespace formcheck
