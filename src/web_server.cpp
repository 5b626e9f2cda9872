#include "web_server.hpp"
#include "analysis_errors.hpp"
#include "request_parser.hpp"
#include "pose/blazepose_estimator.hpp"
#include <iostream>
#include <ctime>
#include <stdexcept>

namespace formcheck {

namespace {

// Raised for bodies that are not JSON at all
class MalformedBody : public std::runtime_error {
public:
    explicit MalformedBody(const std::string& message) : std::runtime_error(message) {}
};

} // namespace

WebServer::WebServer(const ServiceConfig& config) : config_(config), initialized(false) {
}

bool WebServer::initialize() {
    try {
        std::cout << "Initializing analysis pipeline from: " << config_.models_path << std::endl;

        PoseEstimatorFactory pose_factory = pose::makeBlazePoseFactory(config_.poseModelPath());
        if (!pose_factory) {
            // Integrity checks do not need the pose model
            std::cerr << "Warning: pose model unavailable, /analyze will return 503" << std::endl;
        }

        auto pipeline = std::make_shared<AnalysisPipeline>(
            std::move(pose_factory),
            FarnebackFlowEstimator::factory(),
            std::make_shared<SkillAssessorRegistry>(SkillAssessorRegistry::withDefaults()));

        service_ = std::make_unique<AnalysisService>(
            pipeline,
            config_.resolvedWorkerCount(),
            std::chrono::seconds(config_.timeout_seconds));

        // Health check endpoint
        CROW_ROUTE(app, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        // Full posture, skill, injury risk and integrity analysis
        CROW_ROUTE(app, "/analyze").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleAnalyze(req);
        });

        // Integrity verdict only (fail-open)
        CROW_ROUTE(app, "/integrity-check").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleIntegrityCheck(req);
        });

        initialized = true;
        std::cout << "Web server initialized successfully!" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start() {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << config_.port << std::endl;
    app.port(static_cast<uint16_t>(config_.port)).multithreaded().run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleAnalyze(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);

        VideoReference video = parseVideoReference(request_data);
        AnalysisRequest request = parseAnalysisRequest(request_data, config_.analysis);

        if (!service_->hasPoseEstimator()) {
            return createResponse(503, createErrorResponse("Pose estimation model not available", 503));
        }

        FormIntegrityResult result = service_->analyze(video, request);

        json response_data = result.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        response_data["error"] = nullptr;
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const MalformedBody& e) {
        return createResponse(400, createErrorResponse(e.what(), 400));
    } catch (const std::invalid_argument& e) {
        return createResponse(400, createErrorResponse(e.what(), 400));
    } catch (const DecodeError& e) {
        std::cerr << "Video could not be decoded: " << e.what() << std::endl;
        json error_response = createErrorResponse(std::string("Video could not be decoded: ") + e.what(), 422);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(422, error_response);
    } catch (const VideoFetchError& e) {
        std::cerr << "Video could not be fetched: " << e.what() << std::endl;
        json error_response = createErrorResponse(std::string("Video could not be fetched: ") + e.what(), 422);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(422, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error analyzing video: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal server error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

crow::response WebServer::handleIntegrityCheck(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);

        VideoReference video = parseVideoReference(request_data);
        AnalysisConfig config = parseIntegrityConfig(request_data, config_.analysis);

        IntegrityVerdict verdict = service_->checkIntegrity(video, config);

        json response_data = {
            {"integrity_verdict", verdict.toJson()},
            {"processing_time_ms", timer.elapsed_ms()},
            {"error", nullptr}
        };
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const MalformedBody& e) {
        return createResponse(400, createErrorResponse(e.what(), 400));
    } catch (const std::invalid_argument& e) {
        return createResponse(400, createErrorResponse(e.what(), 400));
    } catch (const std::exception& e) {
        std::cerr << "Error checking integrity: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal server error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    (void)req;
    json health_data = {
        {"status", "healthy"},
        {"pose_model_loaded", initialized && service_ && service_->hasPoseEstimator()},
        {"workers", service_ ? service_->workerCount() : 0},
        {"pending_tasks", service_ ? service_->pendingTasks() : 0},
        {"timeout_seconds", config_.timeout_seconds},
        {"version", "1.0.0"},
        {"timestamp", std::time(nullptr)}
    };

    return createResponse(200, createSuccessResponse(health_data));
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw MalformedBody("Invalid JSON in request body");
    }
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}

} // namespace formcheck
