#include "screen_probe.hpp"
#include "image_stats.hpp"
#include <cmath>

namespace probes {

bool ScreenProbe::isDisplayAspect(double aspect) {
    if (aspect < 1.0 && aspect > 0.0) {
        aspect = 1.0 / aspect;
    }
    const double display_aspects[] = {16.0 / 9.0, 16.0 / 10.0, 4.0 / 3.0, 21.0 / 9.0};
    for (double target : display_aspects) {
        if (std::abs(aspect - target) < 0.1) {
            return true;
        }
    }
    return false;
}

int ScreenProbe::countScreenRectangles(const cv::Mat& gray) {
    cv::Mat bright;
    cv::threshold(gray, bright, 180, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bright, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    double min_area = gray.total() * 0.05;
    int count = 0;
    for (const auto& contour : contours) {
        double area = cv::contourArea(contour);
        if (area < min_area) {
            continue;
        }
        std::vector<cv::Point> approx;
        cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true), true);
        if (approx.size() != 4 || !cv::isContourConvex(approx)) {
            continue;
        }
        cv::Rect box = cv::boundingRect(approx);
        if (box.height > 0 && isDisplayAspect(static_cast<double>(box.width) / box.height)) {
            count++;
        }
    }
    return count;
}

ProbeResult ScreenProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty() || input.image.channels() != 3) {
        return neutral("color_input_required");
    }

    cv::Mat image;
    if (input.image.cols > 640) {
        double scale = 640.0 / input.image.cols;
        cv::resize(input.image, image, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        image = input.image;
    }

    cv::Mat gray = toGray(image);
    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    std::vector<cv::Mat> hsv_channels;
    cv::split(hsv, hsv_channels);
    double total = static_cast<double>(gray.total());

    float confidence = 0.0f;
    std::vector<std::string> indicators;

    int rectangles = countScreenRectangles(gray);
    if (rectangles > 0) {
        confidence += RECTANGLE_WEIGHT;
        indicators.push_back("display_rectangle");
    }

    double saturation_ratio = cv::countNonZero(hsv_channels[1] > 150) / total;
    if (saturation_ratio > HIGH_SATURATION_RATIO) {
        confidence += SATURATION_WEIGHT;
        indicators.push_back("high_saturation");
    }

    double dark_ratio = cv::countNonZero(hsv_channels[2] < 50) / total;
    double bright_ratio = cv::countNonZero(hsv_channels[2] > 200) / total;
    if (dark_ratio > DARK_RATIO && bright_ratio > BRIGHT_RATIO) {
        confidence += DARK_BRIGHT_WEIGHT;
        indicators.push_back("dark_background_bright_elements");
    }

    double edges = edgeDensity(gray, 50, 150);
    if (edges > EDGE_DENSITY) {
        confidence += EDGE_WEIGHT;
        indicators.push_back("dense_edges");
    }

    // UI content is dominated by horizontal and vertical structure
    cv::Mat gx, gy, magnitude, angle;
    cv::Sobel(gray, gx, CV_32F, 1, 0);
    cv::Sobel(gray, gy, CV_32F, 0, 1);
    cv::cartToPolar(gx, gy, magnitude, angle, true);
    long strong = 0, axis_aligned = 0;
    for (int y = 0; y < magnitude.rows; y++) {
        const float* mag_row = magnitude.ptr<float>(y);
        const float* ang_row = angle.ptr<float>(y);
        for (int x = 0; x < magnitude.cols; x++) {
            if (mag_row[x] < 50.0f) {
                continue;
            }
            strong++;
            float folded = std::fmod(ang_row[x], 90.0f);
            if (folded < 10.0f || folded > 80.0f) {
                axis_aligned++;
            }
        }
    }
    double axis_ratio = strong > 0 ? static_cast<double>(axis_aligned) / strong : 0.0;
    if (axis_ratio > AXIS_ALIGNED_RATIO) {
        confidence += GRADIENT_WEIGHT;
        indicators.push_back("axis_aligned_gradients");
    }

    int blocks = 0, uniform_blocks = 0;
    for (int y = 0; y + 16 <= gray.rows; y += 16) {
        for (int x = 0; x + 16 <= gray.cols; x += 16) {
            cv::Scalar block_mean, block_std;
            cv::meanStdDev(gray(cv::Rect(x, y, 16, 16)), block_mean, block_std);
            blocks++;
            if (block_std[0] < 3.0) {
                uniform_blocks++;
            }
        }
    }
    double uniform_ratio = blocks > 0 ? static_cast<double>(uniform_blocks) / blocks : 0.0;
    if (uniform_ratio > UNIFORM_BLOCK_RATIO) {
        confidence += UNIFORM_BLOCK_WEIGHT;
        indicators.push_back("uniform_blocks");
    }

    ProbeResult result;
    result.score = clamp01(confidence);
    result.details = {
        {"screen_confidence", result.score},
        {"indicators", indicators},
        {"display_rectangles", rectangles},
        {"high_saturation_ratio", saturation_ratio},
        {"dark_ratio", dark_ratio},
        {"bright_ratio", bright_ratio},
        {"edge_density", edges},
        {"axis_aligned_ratio", axis_ratio},
        {"uniform_block_ratio", uniform_ratio}
    };
    return result;
}

} // namespace probes
