#include "filter_probe.hpp"
#include "image_stats.hpp"

namespace probes {

ProbeResult FilterProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty() || input.image.channels() != 3) {
        return neutral("color_input_required");
    }

    cv::Mat image;
    if (input.image.cols > 512) {
        double scale = 512.0 / input.image.cols;
        cv::resize(input.image, image, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        image = input.image;
    }

    cv::Mat gray = toGray(image);
    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    std::vector<cv::Mat> hsv_channels;
    cv::split(hsv, hsv_channels);

    float score = 0.0f;
    std::vector<std::string> filter_types;

    // Smoothed skin with crisp outlines
    double laplacian_var = laplacianVariance(gray);
    double edges = edgeDensity(gray, 100, 200);
    bool beauty_smoothing = laplacian_var < SMOOTH_LAPLACIAN_VAR && edges > SHARP_EDGE_DENSITY;
    if (beauty_smoothing) {
        score += 0.2f;
        filter_types.push_back("beauty_smoothing");
    }

    // Hue distribution of coloured pixels
    std::vector<double> hue_hist(18, 0.0);
    long orange = 0, teal = 0, colored = 0;
    for (int y = 0; y < hsv.rows; y++) {
        const cv::Vec3b* row = hsv.ptr<cv::Vec3b>(y);
        for (int x = 0; x < hsv.cols; x++) {
            if (row[x][1] <= 30) {
                continue;
            }
            int hue = row[x][0];
            hue_hist[std::min(17, hue / 10)] += 1.0;
            colored++;
            if (hue >= 5 && hue <= 25) {
                orange++;
            } else if (hue >= 85 && hue <= 105) {
                teal++;
            }
        }
    }
    double hue_entropy = normalizedEntropy(hue_hist);
    bool graded = colored > 0 && hue_entropy < LOW_HUE_ENTROPY;
    if (graded) {
        score += 0.15f;
        filter_types.push_back("color_grading");
    }

    double orange_fraction = colored > 0 ? static_cast<double>(orange) / colored : 0.0;
    double teal_fraction = colored > 0 ? static_cast<double>(teal) / colored : 0.0;
    bool orange_teal = orange_fraction > ORANGE_TEAL_FRACTION && teal_fraction > ORANGE_TEAL_FRACTION;
    if (orange_teal) {
        score += 0.2f;
        filter_types.push_back("orange_teal");
    }

    double vignette = brightnessDistanceCorrelation(gray);
    bool has_vignette = vignette < VIGNETTE_CORRELATION;
    if (has_vignette) {
        score += 0.15f;
        filter_types.push_back("vignette");
    }

    // Skin luminance uniformity in YCrCb skin range
    cv::Mat ycrcb, skin_mask;
    cv::cvtColor(image, ycrcb, cv::COLOR_BGR2YCrCb);
    cv::inRange(ycrcb, cv::Scalar(0, 133, 77), cv::Scalar(255, 173, 127), skin_mask);
    double skin_fraction = static_cast<double>(cv::countNonZero(skin_mask)) / skin_mask.total();
    double skin_luma_std = 0.0;
    bool uniform_skin = false;
    if (skin_fraction > SKIN_FRACTION_MIN) {
        std::vector<cv::Mat> ycrcb_channels;
        cv::split(ycrcb, ycrcb_channels);
        cv::Scalar luma_mean, luma_std;
        cv::meanStdDev(ycrcb_channels[0], luma_mean, luma_std, skin_mask);
        skin_luma_std = luma_std[0];
        uniform_skin = skin_luma_std < SKIN_LUMA_STD;
        if (uniform_skin) {
            score += 0.15f;
            filter_types.push_back("skin_uniformity");
        }
    }

    cv::Scalar sat_mean, sat_std;
    cv::meanStdDev(hsv_channels[1], sat_mean, sat_std);
    if (sat_mean[0] > SATURATION_BOOSTED) {
        score += 0.1f;
        filter_types.push_back("saturation_boost");
    } else if (sat_mean[0] < SATURATION_MUTED) {
        score += 0.1f;
        filter_types.push_back("desaturated");
    }
    if (sat_std[0] < SATURATION_STD_UNIFORM) {
        score += 0.05f;
    }

    ProbeResult result;
    result.score = clamp01(score);
    result.details = {
        {"filter_intensity", result.score},
        {"filter_types", filter_types},
        {"laplacian_variance", laplacian_var},
        {"edge_density", edges},
        {"hue_entropy", hue_entropy},
        {"orange_fraction", orange_fraction},
        {"teal_fraction", teal_fraction},
        {"vignette_correlation", vignette},
        {"skin_fraction", skin_fraction},
        {"skin_luma_std", skin_luma_std},
        {"saturation_mean", sat_mean[0]},
        {"saturation_std", sat_std[0]}
    };
    return result;
}

} // namespace probes
