#include "web_server.hpp"
#include "fakescan_errors.hpp"
#include "redis_cache.hpp"
#include <iostream>
#include <ctime>
#include <cstdlib>

WebServer::WebServer(const DetectionConfig& config) : initialized(false) {
    detector_context = std::make_unique<DetectorContext>(config);
    media_decoder = std::make_unique<MediaDecoder>(config.video_frame_count);
}

std::unique_ptr<ResultCache> WebServer::createResultCache() {
    const char* redis_url = std::getenv("REDIS_URL");
    if (redis_url != nullptr && *redis_url != '\0') {
        RedisEndpoint endpoint = RedisCache::parseUrl(redis_url);
        std::cout << "Attempting to connect to Redis at " << endpoint.host << ":" << endpoint.port << std::endl;

        auto redis = std::make_unique<RedisCache>();
        if (redis->initialize(endpoint.host, endpoint.port, endpoint.password)) {
            return redis;
        }
        std::cerr << "Warning: Redis unavailable, using in-memory result cache" << std::endl;
    }
    return std::make_unique<AnalysisCache>();
}

bool WebServer::initialize(const std::string& models_path_param) {
    models_path = models_path_param;

    try {
        std::cout << "Initializing detection models from: " << models_path << std::endl;

        if (!detector_context->initialize(models_path)) {
            std::cerr << "Required files in " << models_path << ":" << std::endl;
            std::cerr << "  - deepfake_classifier.onnx" << std::endl;
            std::cerr << "  - haarcascade_frontalface_default.xml (or a system OpenCV install)" << std::endl;
            return false;
        }

        analyzer = std::make_unique<DeepfakeAnalyzer>(*detector_context);
        result_cache = createResultCache();

        CROW_ROUTE(app, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        CROW_ROUTE(app, "/analyze").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleAnalyze(req);
        });

        initialized = true;
        std::cout << "Web server initialized successfully!" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start(int port) {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << port << std::endl;
    app.port(port).multithreaded().run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleAnalyze(const crow::request& req) {
    Timer timer;

    json request_data;
    try {
        request_data = parseRequestBody(req.body);
    } catch (const std::exception& e) {
        return createResponse(400, createErrorResponse(e.what()));
    }

    if (!validateAnalyzeRequest(request_data)) {
        return createResponse(400, createErrorResponse("Invalid request format. Required: image_url"));
    }

    std::string image_url = request_data["image_url"];
    bool force_reanalyze = request_data.value("force_reanalyze", false);
    std::string cache_key = ResultCache::keyFor(image_url);

    if (!force_reanalyze) {
        if (auto cached = result_cache->get(cache_key)) {
            std::cout << "Returning cached analysis for " << cache_key << std::endl;
            json response_data = *cached;
            response_data["cached"] = true;
            response_data["processing_time_ms"] = timer.elapsed_ms();
            return createResponse(200, createSuccessResponse(response_data));
        }
    }

    try {
        DecodedMedia media = media_decoder->decode(image_url);
        AnalysisResult result = analyzer->analyze(media);

        json response_data = result.toJson();
        response_data["media_type"] = mediaTypeToString(media.type);
        response_data["model_version"] = detector_context->modelVersion();

        if (!result_cache->put(cache_key, response_data)) {
            std::cerr << "Warning: failed to cache analysis for " << cache_key << std::endl;
        }

        response_data["cached"] = false;
        response_data["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const MediaDecodeError& e) {
        std::cerr << "Media decode failed: " << e.what() << std::endl;
        json error_response = createErrorResponse(std::string("Failed to load media: ") + e.what(), 400);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(400, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error in analysis: " << e.what() << std::endl;
        json error_response = createErrorResponse(std::string("Analysis failed: ") + e.what(), 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

crow::response WebServer::handleHealthCheck(const crow::request&) {
    json health_data = {
        {"status", "healthy"},
        {"model_loaded", initialized && detector_context->isReady()},
        {"model_version", detector_context->modelVersion()},
        {"cache", result_cache ? result_cache->stats() : json(nullptr)},
        {"timestamp", std::time(nullptr)}
    };
    return createResponse(200, createSuccessResponse(health_data));
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::parse_error&) {
        throw std::runtime_error("Invalid JSON in request body");
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

bool WebServer::validateAnalyzeRequest(const json& request_data) {
    return request_data.is_object() &&
           request_data.contains("image_url") && request_data["image_url"].is_string() &&
           !request_data["image_url"].get<std::string>().empty() &&
           (!request_data.contains("force_reanalyze") || request_data["force_reanalyze"].is_boolean());
}
