#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "analysis_config.hpp"
#include "analysis_service.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>

using json = nlohmann::json;

namespace formcheck {

class WebServer {
public:
    explicit WebServer(const ServiceConfig& config);
    ~WebServer() = default;

    // Loads the pose model, starts the worker pool and registers routes
    bool initialize();

    // Start server (blocking)
    void start();

    void stop();

private:
    ServiceConfig config_;
    std::unique_ptr<AnalysisService> service_;

    // Crow app
    crow::SimpleApp app;

    bool initialized;

    // Endpoint handlers
    crow::response handleAnalyze(const crow::request& req);
    crow::response handleIntegrityCheck(const crow::request& req);
    crow::response handleHealthCheck(const crow::request& req);

    // Helper methods
    json parseRequestBody(const std::string& body);
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    // Timing utility
    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };
};

} // namespace formcheck

#endif // WEB_SERVER_HPP
