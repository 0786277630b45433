#include "noise_pattern_probe.hpp"
#include "image_stats.hpp"

namespace probes {

float NoisePatternProbe::suspicionFromStd(double noise_std) {
    if (noise_std < TOO_UNIFORM_STD) {
        return 0.7f;
    }
    if (noise_std > TOO_CHAOTIC_STD) {
        return 0.5f;
    }
    return 0.0f;
}

cv::Mat NoisePatternProbe::residual(const cv::Mat& image) {
    cv::Mat gray;
    toGray(image).convertTo(gray, CV_32F);
    cv::Mat blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    return gray - blurred;
}

ProbeResult NoisePatternProbe::analyze(const ProbeInput& input) const {
    const cv::Mat& source = input.face_crop.empty() ? input.image : input.face_crop;
    if (source.empty()) {
        return neutral("empty_input");
    }

    cv::Mat noise = residual(source);
    cv::Scalar noise_mean, noise_std;
    cv::meanStdDev(noise, noise_mean, noise_std);

    ProbeResult result;
    result.score = suspicionFromStd(noise_std[0]);
    result.details = {
        {"noise_std", noise_std[0]},
        {"noise_mean_abs", cv::mean(cv::abs(noise))[0]},
        {"noise_suspicious", result.score > 0.3f}
    };
    return result;
}

} // namespace probes
