#ifndef GENERATOR_SIGNATURES_HPP
#define GENERATOR_SIGNATURES_HPP

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace probes {

using json = nlohmann::json;

struct SignatureScore {
    float score = 0.0f;
    std::vector<std::string> signatures;
    json details = json::object();
};

// Per-generator-family artifact detectors used when no face is present.
// Each works on a BGR image and a matching gray copy.
SignatureScore detectDalleSignature(const cv::Mat& image, const cv::Mat& gray);
SignatureScore detectMidjourneySignature(const cv::Mat& image, const cv::Mat& gray);
SignatureScore detectStableDiffusionSignature(const cv::Mat& image, const cv::Mat& gray);

// Generic generator traits
SignatureScore analyzeColorBanding(const cv::Mat& gray);
SignatureScore analyzeTextureUniformity(const cv::Mat& gray);

} // namespace probes

#endif // GENERATOR_SIGNATURES_HPP
