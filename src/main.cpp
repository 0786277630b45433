#include "web_server.hpp"
#include "detection_config.hpp"
#include "fakescan_errors.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <signal.h>

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
    exit(0);
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT        Server port (default: 8080)\n"
              << "  --models PATH      Path to models directory (default: ./models)\n"
              << "  --config PATH      Detection thresholds as JSON (default: built-in)\n"
              << "  --analyze SOURCE   Analyze one URL, data URL or file, print JSON and exit\n"
              << "  --help             Show this help message\n"
              << std::endl;
}

// One-shot analysis without the HTTP layer
int runAnalysis(const DetectionConfig& config, const std::string& models_path, const std::string& source) {
    DetectorContext context(config);
    if (!context.initialize(models_path)) {
        std::cerr << "Failed to load detection models from " << models_path << std::endl;
        return 1;
    }

    try {
        MediaDecoder decoder(config.video_frame_count);
        DecodedMedia media = decoder.decode(source);

        DeepfakeAnalyzer analyzer(context);
        AnalysisResult result = analyzer.analyze(media);

        json output = result.toJson();
        output["media_type"] = mediaTypeToString(media.type);
        output["model_version"] = context.modelVersion();
        std::cout << output.dump(2) << std::endl;
        return 0;
    } catch (const MediaDecodeError& e) {
        std::cerr << "Error: failed to load media: " << e.what() << std::endl;
        return 2;
    } catch (const FakescanError& e) {
        std::cerr << "Error: analysis failed: " << e.what() << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {
    // Default configuration
    int port = 8080;
    std::string models_path = "./models";
    std::string config_path;
    std::string analyze_source;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                    return 1;
                }
            } catch (const std::exception& e) {
                std::cerr << "Error: Invalid port number" << std::endl;
                return 1;
            }
        } else if (arg == "--models" && i + 1 < argc) {
            models_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--analyze" && i + 1 < argc) {
            analyze_source = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Validate models directory
    if (!std::filesystem::exists(models_path)) {
        std::cerr << "Error: Models directory does not exist: " << models_path << std::endl;
        std::cerr << "It must contain deepfake_classifier.onnx and, optionally, "
                  << "shape_predictor_68_face_landmarks.dat." << std::endl;
        return 1;
    }

    DetectionConfig config;
    if (!config_path.empty()) {
        try {
            config = DetectionConfig::loadFromFile(config_path);
        } catch (const FakescanError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }

    if (!analyze_source.empty()) {
        return runAnalysis(config, models_path, analyze_source);
    }

    // Setup signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        std::cout << "=== Fakescan Deepfake Detection Service ===" << std::endl;
        std::cout << "Port: " << port << std::endl;
        std::cout << "Models path: " << models_path << std::endl;
        std::cout << "Thresholds: fake > " << config.fake_threshold
                  << ", suspicious > " << config.suspicious_threshold << std::endl;
        std::cout << "===========================================" << std::endl;

        // Create and initialize server
        global_server = std::make_unique<WebServer>(config);

        if (!global_server->initialize(models_path)) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        std::cout << "\nServer ready! Available endpoints:" << std::endl;
        std::cout << "  GET  /health           - Health check" << std::endl;
        std::cout << "  POST /analyze          - Score an image or video URL" << std::endl;
        std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

        // Start server (blocking call)
        global_server->start(port);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
