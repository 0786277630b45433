#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "detector_context.hpp"
#include "deepfake_analyzer.hpp"
#include "media_decoder.hpp"
#include "analysis_cache.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>

using json = nlohmann::json;

class WebServer {
public:
    explicit WebServer(const DetectionConfig& config);
    ~WebServer() = default;

    // Load models and pick the result cache (Redis when REDIS_URL connects)
    bool initialize(const std::string& models_path);

    // Start server
    void start(int port = 8080);

    // Stop server
    void stop();

private:
    // Core components
    std::unique_ptr<DetectorContext> detector_context;
    std::unique_ptr<DeepfakeAnalyzer> analyzer;
    std::unique_ptr<MediaDecoder> media_decoder;
    std::unique_ptr<ResultCache> result_cache;

    // Crow app
    crow::SimpleApp app;

    // Server state
    bool initialized;
    std::string models_path;

    // Endpoint handlers
    crow::response handleAnalyze(const crow::request& req);
    crow::response handleHealthCheck(const crow::request& req);

    // Helper methods
    json parseRequestBody(const std::string& body);
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    bool validateAnalyzeRequest(const json& request_data);

    std::unique_ptr<ResultCache> createResultCache();

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

#endif // WEB_SERVER_HPP
