#include "stylization_probe.hpp"
#include "image_stats.hpp"
#include <algorithm>
#include <functional>

namespace probes {

std::string styleTypeToString(StyleType type) {
    switch (type) {
        case StyleType::RENDER_3D: return "3d_render";
        case StyleType::CARTOON: return "cartoon";
        case StyleType::ANIME: return "anime";
        case StyleType::DIGITAL_ART: return "digital_art";
        case StyleType::AVATAR: return "avatar";
        case StyleType::UNKNOWN: return "unknown";
        default: return "photorealistic";
    }
}

StyleDecision StylizationProbe::decide(const StyleComponents& c) {
    StyleDecision decision;
    double combined = c.skin * SKIN_WEIGHT + c.edge * EDGE_WEIGHT + c.color * COLOR_WEIGHT +
                      c.outline * OUTLINE_WEIGHT;
    if (c.render_signature) {
        combined += RENDER_SIGNATURE_BONUS;
    }
    decision.combined = static_cast<float>(std::min(1.0, combined));

    if (decision.combined > STYLIZED_THRESHOLD) {
        decision.is_stylized = true;
        if (c.outline > 0.6f) {
            decision.style_type = c.skin > 0.7f ? StyleType::ANIME : StyleType::CARTOON;
        } else if ((c.skin > 0.75f && c.edge > 0.6f) || (c.render_signature && c.skin > 0.6f)) {
            decision.style_type = StyleType::RENDER_3D;
        } else if (c.color > 0.7f) {
            decision.style_type = StyleType::DIGITAL_ART;
        } else {
            decision.style_type = StyleType::AVATAR;
        }
        decision.fake_boost = static_cast<float>(std::min(decision.combined * 0.5, MAX_BOOST));
    } else if (decision.combined > UNCERTAIN_THRESHOLD) {
        decision.is_stylized = true;
        decision.style_type = StyleType::UNKNOWN;
        decision.fake_boost = decision.combined * 0.3f;
    }
    return decision;
}

float StylizationProbe::skinSmoothness(const cv::Mat& image, json& details) {
    cv::Mat lab;
    cv::cvtColor(image, lab, cv::COLOR_BGR2Lab);
    cv::Mat skin_mask;
    cv::inRange(lab, cv::Scalar(41, 116, 116), cv::Scalar(229, 159, 169), skin_mask);

    cv::Mat variance = localVariance(toGray(image), 5);
    int skin_pixels = cv::countNonZero(skin_mask);

    cv::Scalar var_mean, var_std;
    if (skin_pixels > 500) {
        cv::meanStdDev(variance, var_mean, var_std, skin_mask);
    } else {
        cv::meanStdDev(variance, var_mean, var_std);
    }
    double texture_var = var_mean[0];

    float score;
    std::string assessment;
    if (texture_var < 20) {
        score = 0.9f;
        assessment = "very_smooth";
    } else if (texture_var < 50) {
        score = 0.7f;
        assessment = "smooth";
    } else if (texture_var < 100) {
        score = 0.4f;
        assessment = "moderate";
    } else {
        score = 0.1f;
        assessment = "natural";
    }

    details["skin_texture"] = {
        {"skin_pixels", skin_pixels},
        {"texture_variance", texture_var},
        {"texture_std", var_std[0]},
        {"assessment", assessment}
    };
    return score;
}

float StylizationProbe::edgeSynthetic(const cv::Mat& gray, json& details) {
    cv::Mat edges_low, edges_high;
    cv::Canny(gray, edges_low, 30, 80);
    cv::Canny(gray, edges_high, 80, 200);
    int low_count = cv::countNonZero(edges_low);
    int high_count = cv::countNonZero(edges_high);

    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, magnitude);

    double uniformity = 0.5;
    if (low_count > 100) {
        cv::Scalar grad_mean, grad_std;
        cv::meanStdDev(magnitude, grad_mean, grad_std, edges_low);
        uniformity = 1.0 - grad_std[0] / (grad_mean[0] + 1.0);
    }

    float score = uniformity > 0.7 ? 0.8f : (uniformity > 0.5 ? 0.5f : 0.2f);
    details["edge_quality"] = {
        {"edge_ratio", static_cast<double>(high_count) / (low_count + 1)},
        {"edge_uniformity", uniformity},
        {"edge_pixels_low", low_count},
        {"edge_pixels_high", high_count}
    };
    return score;
}

float StylizationProbe::colorPalette(const cv::Mat& image, const cv::Mat& gray, json& details) {
    cv::Mat small;
    cv::resize(image, small, cv::Size(PALETTE_SIZE, PALETTE_SIZE), 0, 0, cv::INTER_AREA);
    cv::Mat pixels;
    small.reshape(1, static_cast<int>(small.total())).convertTo(pixels, CV_32F);

    float color_score;
    double top3 = 0.0, top5 = 0.0;
    try {
        // Seeded so repeated runs agree
        cv::theRNG() = cv::RNG(0x5EED);
        cv::Mat labels, centers;
        cv::kmeans(pixels, PALETTE_CLUSTERS, labels,
                   cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, 10, 1.0),
                   3, cv::KMEANS_PP_CENTERS, centers);

        std::vector<double> shares(PALETTE_CLUSTERS, 0.0);
        for (int i = 0; i < labels.rows; i++) {
            shares[labels.at<int>(i)] += 1.0;
        }
        for (double& share : shares) {
            share /= labels.rows;
        }
        std::sort(shares.begin(), shares.end(), std::greater<double>());
        top3 = shares[0] + shares[1] + shares[2];
        top5 = top3 + shares[3] + shares[4];

        if (top3 > 0.7) {
            color_score = 0.85f;
        } else if (top5 > 0.8) {
            color_score = 0.6f;
        } else {
            color_score = 0.2f;
        }
    } catch (const cv::Exception& e) {
        details["color_palette_error"] = e.what();
        color_score = 0.3f;
    }

    double laplacian_var = laplacianVariance(gray);
    float flatness_boost = laplacian_var < 200 ? 0.3f : (laplacian_var < 500 ? 0.15f : 0.0f);

    details["color_palette"] = {
        {"top_3_concentration", top3},
        {"top_5_concentration", top5},
        {"laplacian_variance", laplacian_var},
        {"flatness_boost", flatness_boost}
    };
    return std::min(color_score + flatness_boost, 1.0f);
}

float StylizationProbe::cartoonOutlines(const cv::Mat& gray, json& details) {
    cv::Mat dark_mask = gray < 30;
    int dark_pixels = cv::countNonZero(dark_mask);
    double dark_fraction = static_cast<double>(dark_pixels) / dark_mask.total();

    float score = 0.1f;
    double line_indicator = 0.0;
    if (dark_pixels > 100) {
        cv::Mat dilated;
        cv::dilate(dark_mask, dilated, cv::Mat::ones(3, 3, CV_8U));
        line_indicator = static_cast<double>(cv::countNonZero(dilated)) / (dark_pixels + 1);

        if (line_indicator > 2.5 && dark_fraction > 0.02 && dark_fraction < 0.15) {
            score = 0.8f;
        } else if (dark_fraction > 0.01 && dark_fraction < 0.1) {
            score = 0.4f;
        }
    }

    details["cartoon_outlines"] = {
        {"dark_percentage", dark_fraction},
        {"line_indicator", line_indicator}
    };
    return score;
}

bool StylizationProbe::renderSignature(const cv::Mat& image, json& details) {
    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    std::vector<cv::Mat> hsv_channels;
    cv::split(hsv, hsv_channels);

    // Border band stands in for the background
    int band = std::max(1, image.rows / 10);
    cv::Mat border_mask = cv::Mat::ones(image.size(), CV_8U) * 255;
    border_mask(cv::Rect(band, band, image.cols - 2 * band, image.rows - 2 * band)).setTo(0);
    cv::Mat dark_border = (hsv_channels[2] < 60) & border_mask;
    double dark_background = static_cast<double>(cv::countNonZero(dark_border)) / cv::countNonZero(border_mask);

    cv::Mat foreground = hsv_channels[2] >= 60;
    cv::Scalar sat_mean, sat_std;
    bool has_foreground = cv::countNonZero(foreground) > 0;
    if (has_foreground) {
        cv::meanStdDev(hsv_channels[1], sat_mean, sat_std, foreground);
    }

    cv::Mat gray = toGray(image);
    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_32F, 1, 0);
    cv::Sobel(gray, gy, CV_32F, 0, 1);
    cv::magnitude(gx, gy, magnitude);
    double mean_gradient = cv::mean(magnitude)[0];

    bool signature = dark_background > 0.5 && has_foreground && sat_std[0] < 40.0 && mean_gradient < 20.0;
    details["render_signature"] = {
        {"dark_background_ratio", dark_background},
        {"foreground_saturation_std", has_foreground ? sat_std[0] : 0.0},
        {"mean_gradient", mean_gradient},
        {"detected", signature}
    };
    return signature;
}

ProbeResult StylizationProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty() || input.image.channels() != 3) {
        return neutral("color_input_required");
    }

    cv::Mat image;
    if (std::max(input.image.cols, input.image.rows) > ANALYSIS_SIZE) {
        double scale = static_cast<double>(ANALYSIS_SIZE) / std::max(input.image.cols, input.image.rows);
        cv::resize(input.image, image, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        image = input.image;
    }
    cv::Mat gray = toGray(image);

    json details = json::object();
    StyleComponents components;
    components.skin = skinSmoothness(image, details);
    components.edge = edgeSynthetic(gray, details);
    components.color = colorPalette(image, gray, details);
    components.outline = cartoonOutlines(gray, details);
    components.render_signature = renderSignature(image, details);

    std::vector<std::string> indicators;
    if (components.skin > 0.6f) indicators.push_back("unnaturally_smooth_skin");
    if (components.edge > 0.6f) indicators.push_back("synthetic_edge_patterns");
    if (components.color > 0.6f) indicators.push_back("limited_color_palette");
    if (components.outline > 0.5f) indicators.push_back("cartoon_outlines_detected");
    if (components.render_signature) indicators.push_back("3d_render_signature");

    StyleDecision decision = decide(components);

    details["individual_scores"] = {
        {"skin", components.skin},
        {"edge", components.edge},
        {"color", components.color},
        {"outline", components.outline}
    };
    details["combined_score"] = decision.combined;
    details["is_stylized"] = decision.is_stylized;
    details["style_type"] = styleTypeToString(decision.style_type);
    details["fake_boost"] = decision.fake_boost;
    details["indicators"] = indicators;

    ProbeResult result;
    result.score = decision.combined;
    result.details = details;
    return result;
}

} // namespace probes
