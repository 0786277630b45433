#include "landmark_probe.hpp"
#include "image_stats.hpp"
#include <dlib/opencv.h>
#include <cmath>
#include <iostream>

namespace probes {

LandmarkProbe::LandmarkProbe(std::shared_ptr<const dlib::shape_predictor> shape_predictor)
    : Probe("landmark"), shape_predictor_(std::move(shape_predictor)) {
}

double LandmarkProbe::edgeSymmetry(const cv::Mat& gray) {
    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_32F, 1, 0);
    cv::Sobel(gray, gy, CV_32F, 0, 1);
    cv::magnitude(gx, gy, magnitude);

    int half = magnitude.cols / 2;
    if (half == 0) {
        return 0.0;
    }
    cv::Mat left = magnitude(cv::Rect(0, 0, half, magnitude.rows));
    cv::Mat right;
    cv::flip(magnitude(cv::Rect(magnitude.cols - half, 0, half, magnitude.rows)), right, 1);

    double total = cv::sum(left)[0] + cv::sum(right)[0];
    if (total < 1e-6) {
        return 1.0;
    }
    double difference = cv::norm(left, right, cv::NORM_L1);
    return 1.0 - difference / total;
}

double LandmarkProbe::eyeMouthEdgeRatio(const cv::Mat& gray) {
    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);
    int h = edges.rows;
    int w = edges.cols;

    cv::Rect eye_rect(static_cast<int>(w * 0.1), static_cast<int>(h * 0.2),
                      static_cast<int>(w * 0.8), static_cast<int>(h * 0.25));
    cv::Rect mouth_rect(static_cast<int>(w * 0.2), static_cast<int>(h * 0.55),
                        static_cast<int>(w * 0.6), static_cast<int>(h * 0.3));
    if (eye_rect.area() == 0 || mouth_rect.area() == 0) {
        return 1.0;
    }

    double eye_density = static_cast<double>(cv::countNonZero(edges(eye_rect))) / eye_rect.area();
    double mouth_density = static_cast<double>(cv::countNonZero(edges(mouth_rect))) / mouth_rect.area();
    if (mouth_density < 1e-4) {
        return eye_density < 1e-4 ? 1.0 : RATIO_MAX * 2.0;
    }
    return eye_density / mouth_density;
}

double LandmarkProbe::textureStd(const cv::Mat& gray) {
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar mean_val, stddev;
    cv::meanStdDev(laplacian, mean_val, stddev);
    return stddev[0];
}

bool LandmarkProbe::isSymmetryAbnormal(double symmetry) {
    return symmetry > SYMMETRY_TOO_PERFECT || symmetry < SYMMETRY_TOO_LOW;
}

bool LandmarkProbe::isRatioAbnormal(double ratio) {
    return ratio < RATIO_MIN || ratio > RATIO_MAX;
}

float LandmarkProbe::landmarkSymmetry(const cv::Mat& face_crop) const {
    if (!shape_predictor_ || face_crop.channels() != 3) {
        return -1.0f;
    }

    try {
        dlib::cv_image<dlib::bgr_pixel> dlib_image(face_crop);
        // Crops carry a proportional margin; the face sits in the central part
        long inset = static_cast<long>(face_crop.cols * 0.18);
        dlib::rectangle face_rect(inset, inset, face_crop.cols - inset, face_crop.rows - inset);
        dlib::full_object_detection shape = (*shape_predictor_)(dlib_image, face_rect);
        if (shape.num_parts() < 68) {
            return -1.0f;
        }

        const std::vector<std::pair<int, int>> pairs = {
            {0, 16}, {1, 15}, {2, 14}, {3, 13}, {4, 12}, {5, 11}, {6, 10}, {7, 9}
        };
        dlib::point nose_tip = shape.part(30);

        float symmetry = 0.0f;
        int counted = 0;
        for (const auto& pair : pairs) {
            dlib::point left = shape.part(pair.first);
            dlib::point right = shape.part(pair.second);
            float left_dist = std::sqrt(std::pow(left.x() - nose_tip.x(), 2.0f) + std::pow(left.y() - nose_tip.y(), 2.0f));
            float right_dist = std::sqrt(std::pow(right.x() - nose_tip.x(), 2.0f) + std::pow(right.y() - nose_tip.y(), 2.0f));
            float avg_dist = (left_dist + right_dist) / 2.0f;
            if (avg_dist > 0) {
                symmetry += 1.0f - std::abs(left_dist - right_dist) / avg_dist;
                counted++;
            }
        }
        return counted > 0 ? symmetry / counted : -1.0f;
    } catch (const std::exception& e) {
        std::cerr << "Landmark probe: shape prediction failed: " << e.what() << std::endl;
        return -1.0f;
    }
}

ProbeResult LandmarkProbe::analyze(const ProbeInput& input) const {
    if (input.face_crop.empty()) {
        return neutral("no_face_crop");
    }

    cv::Mat gray = toGray(input.face_crop);
    cv::resize(gray, gray, cv::Size(ANALYSIS_SIZE, ANALYSIS_SIZE), 0, 0, cv::INTER_AREA);

    double symmetry = edgeSymmetry(gray);
    double ratio = eyeMouthEdgeRatio(gray);
    double texture = textureStd(gray);

    bool symmetry_abnormal = isSymmetryAbnormal(symmetry);
    bool ratio_abnormal = isRatioAbnormal(ratio);
    bool too_smooth = texture < TEXTURE_TOO_SMOOTH;
    bool too_noisy = texture > TEXTURE_TOO_NOISY;

    float score = 0.0f;
    std::vector<std::string> indicators;
    if (symmetry_abnormal) {
        score += 0.35f;
        indicators.push_back(symmetry > SYMMETRY_TOO_PERFECT ? "symmetry_too_perfect" : "strong_asymmetry");
    }
    if (ratio_abnormal) {
        score += 0.2f;
        indicators.push_back("abnormal_eye_mouth_detail");
    }
    if (too_smooth) {
        score += 0.2f;
        indicators.push_back("texture_too_smooth");
    } else if (too_noisy) {
        score += 0.15f;
        indicators.push_back("texture_too_noisy");
    }

    ProbeResult result;
    result.score = clamp01(score);
    result.details = {
        {"edge_symmetry", symmetry},
        {"eye_mouth_edge_ratio", ratio},
        {"texture_std", texture},
        {"landmark_suspicious", symmetry_abnormal || ratio_abnormal},
        {"too_smooth", too_smooth},
        {"indicators", indicators}
    };

    float geometry = landmarkSymmetry(input.face_crop);
    if (geometry >= 0.0f) {
        result.details["landmark_geometry_symmetry"] = geometry;
    } else {
        result.details["landmark_geometry_symmetry"] = nullptr;
    }
    return result;
}

} // namespace probes
