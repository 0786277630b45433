#include "frequency_probe.hpp"
#include "image_stats.hpp"
#include <cmath>

namespace probes {

double FrequencyProbe::radialSlope(const cv::Mat& log_spectrum) {
    int cx = log_spectrum.cols / 2;
    int cy = log_spectrum.rows / 2;
    int max_radius = std::min(cx, cy) - 1;
    if (max_radius < 4) {
        return 0.0;
    }

    std::vector<double> sums(max_radius + 1, 0.0);
    std::vector<int> counts(max_radius + 1, 0);
    for (int y = 0; y < log_spectrum.rows; y++) {
        const float* row = log_spectrum.ptr<float>(y);
        for (int x = 0; x < log_spectrum.cols; x++) {
            int r = static_cast<int>(std::lround(std::sqrt(double((x - cx) * (x - cx) + (y - cy) * (y - cy)))));
            if (r <= max_radius) {
                sums[r] += row[x];
                counts[r]++;
            }
        }
    }

    // Skip the DC neighbourhood
    std::vector<double> xs, ys;
    for (int r = 2; r <= max_radius; r++) {
        if (counts[r] > 0) {
            xs.push_back(std::log(static_cast<double>(r)));
            ys.push_back(sums[r] / counts[r]);
        }
    }
    if (xs.size() < 2) {
        return 0.0;
    }

    double mx = mean(xs);
    double my = mean(ys);
    double num = 0.0, den = 0.0;
    for (size_t i = 0; i < xs.size(); i++) {
        num += (xs[i] - mx) * (ys[i] - my);
        den += (xs[i] - mx) * (xs[i] - mx);
    }
    return den > 0.0 ? num / den : 0.0;
}

double FrequencyProbe::highFrequencyPeakDensity(const cv::Mat& log_spectrum) {
    int cx = log_spectrum.cols / 2;
    int cy = log_spectrum.rows / 2;
    double max_radius = std::min(cx, cy);
    double start = max_radius * HIGH_FREQ_START;

    cv::Mat mask = cv::Mat::zeros(log_spectrum.size(), CV_8U);
    cv::circle(mask, cv::Point(cx, cy), static_cast<int>(max_radius), cv::Scalar(255), cv::FILLED);
    cv::circle(mask, cv::Point(cx, cy), static_cast<int>(start), cv::Scalar(0), cv::FILLED);

    int band_pixels = cv::countNonZero(mask);
    if (band_pixels == 0) {
        return 0.0;
    }

    cv::Scalar band_mean, band_std;
    cv::meanStdDev(log_spectrum, band_mean, band_std, mask);
    double limit = band_mean[0] + PEAK_SIGMA * band_std[0];

    cv::Mat peaks = (log_spectrum > limit) & mask;
    return static_cast<double>(cv::countNonZero(peaks)) / band_pixels;
}

ProbeResult FrequencyProbe::analyze(const ProbeInput& input) const {
    const cv::Mat& source = input.face_crop.empty() ? input.image : input.face_crop;
    if (source.empty()) {
        return neutral("empty_input");
    }

    cv::Mat gray = toGray(source);
    cv::resize(gray, gray, cv::Size(ANALYSIS_SIZE, ANALYSIS_SIZE), 0, 0, cv::INTER_AREA);
    cv::Mat spectrum = logMagnitudeSpectrum(gray);

    double slope = radialSlope(spectrum);
    double peak_density = highFrequencyPeakDensity(spectrum);

    float score = 0.0f;
    std::vector<std::string> indicators;

    // Natural images decay roughly as 1/f
    if (slope > 0.0) {
        score += 0.5f;
        indicators.push_back("positive_spectral_slope");
    } else if (slope >= -0.5) {
        score += 0.35f;
        indicators.push_back("flat_spectral_decay");
    } else if (slope >= -1.0) {
        score += 0.1f;
    }

    if (peak_density > 0.02) {
        score += 0.4f;
        indicators.push_back("dense_high_frequency_peaks");
    } else if (peak_density > 0.01) {
        score += 0.2f;
        indicators.push_back("high_frequency_peaks");
    }

    ProbeResult result;
    result.score = clamp01(score);
    result.details = {
        {"radial_slope", slope},
        {"high_freq_peak_density", peak_density},
        {"gan_fingerprint_detected", result.score >= 0.4f},
        {"indicators", indicators}
    };
    return result;
}

} // namespace probes
