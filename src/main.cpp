#include "web_server.hpp"
#include "analysis_errors.hpp"
#include "analysis_pipeline.hpp"
#include "pose/blazepose_estimator.hpp"
#include <curl/curl.h>
#include <iostream>
#include <string>
#include <filesystem>
#include <signal.h>

using namespace formcheck;

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT        Server port (default: 8080)\n"
              << "  --models PATH      Path to models directory (default: ./models)\n"
              << "  --workers N        Analysis worker threads (default: one per core)\n"
              << "  --timeout SECONDS  Per-analysis deadline, 0 disables (default: 120)\n"
              << "  --config FILE      JSON file with default analysis options\n"
              << "  --analyze FILE     Analyze one local video, print JSON and exit\n"
              << "  --sport TYPE       Sport for --analyze (default: general)\n"
              << "  --skill TYPE       Skill for --analyze (default: general)\n"
              << "  --help             Show this help message\n"
              << "Environment: FORMCHECK_PORT, FORMCHECK_MODELS_DIR, FORMCHECK_WORKERS,\n"
              << "             FORMCHECK_TIMEOUT_SECONDS (overridden by options)\n"
              << std::endl;
}

// Returns false on a malformed number
bool parseIntArg(const char* value, const char* name, int& target) {
    try {
        target = std::stoi(value);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid value for " << name << ": " << value << std::endl;
        return false;
    }
}

int runSingleAnalysis(const ServiceConfig& config) {
    PoseEstimatorFactory pose_factory = pose::makeBlazePoseFactory(config.poseModelPath());
    if (!pose_factory) {
        std::cerr << "Error: Pose model not available at " << config.poseModelPath() << std::endl;
        return 1;
    }

    AnalysisPipeline pipeline(std::move(pose_factory), FarnebackFlowEstimator::factory(), nullptr);

    AnalysisRequest request;
    request.sport_type = sportTypeFromString(config.sport_type);
    request.skill_type = skillTypeFromString(config.skill_type);
    request.config = config.analysis;

    try {
        VideoSource source = VideoSource::fromFile(config.analyze_file);
        FormIntegrityResult result = pipeline.analyzeIntegrityAndForm(source, request);
        std::cout << result.toJson(false).dump(2) << std::endl;
        return 0;
    } catch (const DecodeError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error analyzing video: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {
    ServiceConfig config;

    // Environment first, command line wins
    config.applyEnvironment();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parseIntArg(argv[++i], "--port", config.port)) return 1;
        } else if (arg == "--models" && i + 1 < argc) {
            config.models_path = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            if (!parseIntArg(argv[++i], "--workers", config.workers)) return 1;
        } else if (arg == "--timeout" && i + 1 < argc) {
            if (!parseIntArg(argv[++i], "--timeout", config.timeout_seconds)) return 1;
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if (arg == "--analyze" && i + 1 < argc) {
            config.analyze_file = argv[++i];
        } else if (arg == "--sport" && i + 1 < argc) {
            config.sport_type = argv[++i];
        } else if (arg == "--skill" && i + 1 < argc) {
            config.skill_type = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (config.port < 1 || config.port > 65535) {
        std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
        return 1;
    }
    if (config.workers < 0) {
        std::cerr << "Error: Worker count cannot be negative" << std::endl;
        return 1;
    }
    if (!config.loadAnalysisDefaults()) {
        return 1;
    }

    if (!std::filesystem::exists(config.models_path)) {
        std::cerr << "Warning: Models directory does not exist: " << config.models_path << std::endl;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (!config.analyze_file.empty()) {
        int status = runSingleAnalysis(config);
        curl_global_cleanup();
        return status;
    }

    // Setup signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    int exit_code = 0;
    try {
        std::cout << "=== formcheck Analysis Service ===" << std::endl;
        std::cout << "Port: " << config.port << std::endl;
        std::cout << "Models path: " << config.models_path << std::endl;
        std::cout << "Workers: " << config.resolvedWorkerCount() << std::endl;
        std::cout << "Timeout: " << config.timeout_seconds << "s" << std::endl;
        std::cout << "==================================" << std::endl;

        global_server = std::make_unique<WebServer>(config);

        if (!global_server->initialize()) {
            std::cerr << "Failed to initialize server" << std::endl;
            exit_code = 1;
        } else {
            std::cout << "\nServer ready! Available endpoints:" << std::endl;
            std::cout << "  GET  /health           - Health check" << std::endl;
            std::cout << "  POST /analyze          - Posture, skill, injury risk and integrity" << std::endl;
            std::cout << "  POST /integrity-check  - Video integrity verdict" << std::endl;
            std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

            // Start server (blocking call)
            global_server->start();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    global_server.reset();
    curl_global_cleanup();
    return exit_code;
}
