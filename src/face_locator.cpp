#include "face_locator.hpp"
#include <cmath>
#include <iostream>

FaceLocator::FaceLocator(const DetectionConfig& config) : config_(config), initialized_(false) {
}

std::vector<std::string> FaceLocator::candidatePaths(const std::string& models_path) const {
    std::vector<std::string> dirs;
    if (!models_path.empty()) {
        dirs.push_back(models_path);
    }
    dirs.push_back("/usr/share/opencv4/haarcascades");
    dirs.push_back("/usr/local/share/opencv4/haarcascades");
    dirs.push_back("/opt/homebrew/share/opencv4/haarcascades");
    dirs.push_back("/usr/share/opencv/haarcascades");

    // Cascade preference order outranks directory order
    std::vector<std::string> paths;
    for (const auto& name : config_.cascade_names) {
        for (const auto& dir : dirs) {
            paths.push_back(dir + "/" + name);
        }
    }
    return paths;
}

bool FaceLocator::initialize(const std::string& models_path) {
    std::lock_guard<std::mutex> lock(cascade_mutex_);
    for (const auto& path : candidatePaths(models_path)) {
        try {
            if (cascade_.load(path) && !cascade_.empty()) {
                cascade_path_ = path;
                initialized_ = true;
                std::cout << "Face locator: loaded cascade " << path << std::endl;
                return true;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "Face locator: failed to load " << path << ": " << e.what() << std::endl;
        }
    }

    std::cerr << "Face locator: no Haar cascade found, face detection disabled" << std::endl;
    initialized_ = false;
    return false;
}

float FaceLocator::scoreDetection(int width, int height) {
    float aspect_ratio = height > 0 ? static_cast<float>(width) / height : 0.0f;
    float size_score = std::min(1.0f, static_cast<float>(width * height) / (150.0f * 150.0f));
    float aspect_score = 1.0f - std::abs(1.0f - aspect_ratio) * 0.5f;
    return (size_score + aspect_score) / 2.0f;
}

cv::Rect FaceLocator::rescaleBox(const cv::Rect& box, double scale, const cv::Size& bounds) {
    if (scale <= 0.0) {
        return box;
    }
    int left = static_cast<int>(std::lround(box.x / scale));
    int top = static_cast<int>(std::lround(box.y / scale));
    int right = static_cast<int>(std::lround((box.x + box.width) / scale));
    int bottom = static_cast<int>(std::lround((box.y + box.height) / scale));

    left = std::max(0, std::min(left, bounds.width));
    top = std::max(0, std::min(top, bounds.height));
    right = std::max(left, std::min(right, bounds.width));
    bottom = std::max(top, std::min(bottom, bounds.height));
    return cv::Rect(left, top, right - left, bottom - top);
}

std::vector<FaceInfo> FaceLocator::detectFaces(const cv::Mat& frame) {
    std::vector<FaceInfo> faces;
    if (!initialized_ || frame.empty()) {
        return faces;
    }

    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    double scale = 1.0;
    if (config_.detection_max_width > 0 && gray.cols > config_.detection_max_width) {
        scale = static_cast<double>(config_.detection_max_width) / gray.cols;
        cv::resize(gray, gray, cv::Size(), scale, scale, cv::INTER_AREA);
    }
    int min_size = std::max(1, static_cast<int>(std::lround(config_.min_face_size * scale)));

    std::vector<cv::Rect> detections;
    {
        std::lock_guard<std::mutex> lock(cascade_mutex_);
        for (const auto& params : config_.detector_params) {
            cascade_.detectMultiScale(gray, detections, params.scale_factor, params.min_neighbors,
                                      cv::CASCADE_SCALE_IMAGE, cv::Size(min_size, min_size));
            if (!detections.empty()) {
                break;
            }
        }
    }

    for (size_t i = 0; i < detections.size(); i++) {
        cv::Rect box = scale == 1.0 ? detections[i] : rescaleBox(detections[i], scale, frame.size());
        float confidence = scoreDetection(box.width, box.height);
        if (confidence < config_.face_confidence_threshold) {
            continue;
        }

        FaceInfo face;
        face.bbox = box;
        face.confidence = confidence;
        face.index = static_cast<int>(i);
        faces.push_back(face);
    }

    return faces;
}
