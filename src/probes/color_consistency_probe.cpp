#include "color_consistency_probe.hpp"
#include "image_stats.hpp"
#include <cmath>

namespace probes {

float ColorConsistencyProbe::suspicionFromSpread(double a_std, double b_std) {
    double a_deviation = std::abs(a_std - OPTIMAL_STD) / OPTIMAL_STD;
    double b_deviation = std::abs(b_std - OPTIMAL_STD) / OPTIMAL_STD;
    return static_cast<float>(std::min(1.0, (a_deviation + b_deviation) / 2.0));
}

ProbeResult ColorConsistencyProbe::analyze(const ProbeInput& input) const {
    const cv::Mat& source = input.face_crop.empty() ? input.image : input.face_crop;
    if (source.empty() || source.channels() != 3) {
        return neutral("color_input_required");
    }

    cv::Mat lab;
    cv::cvtColor(source, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);

    cv::Scalar a_mean, a_std, b_mean, b_std;
    cv::meanStdDev(channels[1], a_mean, a_std);
    cv::meanStdDev(channels[2], b_mean, b_std);

    ProbeResult result;
    result.score = suspicionFromSpread(a_std[0], b_std[0]);
    result.details = {
        {"a_std", a_std[0]},
        {"b_std", b_std[0]},
        {"color_suspicious", result.score > 0.4f}
    };
    return result;
}

} // namespace probes
