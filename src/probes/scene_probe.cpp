#include "scene_probe.hpp"
#include "image_stats.hpp"
#include <cmath>

namespace probes {

std::string sceneVerdictToString(SceneVerdict verdict) {
    switch (verdict) {
        case SceneVerdict::LIKELY_AI_GENERATED: return "likely_ai_generated";
        case SceneVerdict::SUSPICIOUS: return "suspicious";
        default: return "likely_authentic";
    }
}

GeneratorMatch SceneProbe::pickGenerator(float dalle, float midjourney, float stable_diffusion, float generic) {
    const std::pair<const char*, float> candidates[] = {
        {"dall-e", dalle},
        {"midjourney", midjourney},
        {"stable_diffusion", stable_diffusion},
        {"generic_ai", generic}
    };

    // First maximum wins on ties
    const std::pair<const char*, float>* best = &candidates[0];
    for (const auto& candidate : candidates) {
        if (candidate.second > best->second) {
            best = &candidate;
        }
    }

    GeneratorMatch match;
    if (best->second < LIKELY_REAL_BELOW) {
        match.generator = "likely_real";
        match.confidence = 1.0f - best->second;
        match.likely_real = true;
    } else {
        match.generator = best->first;
        match.confidence = best->second;
        match.likely_real = false;
    }
    return match;
}

BackgroundResult SceneProbe::analyzeBackground(const cv::Mat& gray) {
    BackgroundResult result;
    float total = 0.0f;

    int cell_h = gray.rows / GRID_SIZE;
    int cell_w = gray.cols / GRID_SIZE;
    if (cell_h == 0 || cell_w == 0) {
        result.details["error"] = "image_too_small";
        return result;
    }

    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);
    cv::Mat blurred, gray_f, blurred_f;
    cv::GaussianBlur(gray, blurred, cv::Size(11, 11), 0);
    gray.convertTo(gray_f, CV_64F);
    blurred.convertTo(blurred_f, CV_64F);
    cv::Mat blur_diff = cv::abs(gray_f - blurred_f);

    std::vector<double> edge_densities;
    std::vector<double> blur_variances;
    for (int i = 0; i < GRID_SIZE; i++) {
        for (int j = 0; j < GRID_SIZE; j++) {
            cv::Rect cell(j * cell_w, i * cell_h, cell_w, cell_h);
            edge_densities.push_back(static_cast<double>(cv::countNonZero(edges(cell))) / cell.area());
            cv::Scalar cell_mean, cell_std;
            cv::meanStdDev(blur_diff(cell), cell_mean, cell_std);
            blur_variances.push_back(cell_std[0] * cell_std[0]);
        }
    }

    double background_threshold = percentile(edge_densities, 30.0);
    std::vector<double> low_cells;
    for (double density : edge_densities) {
        if (density < background_threshold) {
            low_cells.push_back(density);
        }
    }
    double background_variance = 0.0;
    if (low_cells.size() > 5) {
        background_variance = populationVariance(low_cells);
        if (background_variance < 0.0001) {
            result.artifacts.push_back("too_uniform_background");
            total += 0.2f;
        }
    }

    double blur_inconsistency = std::sqrt(populationVariance(blur_variances)) / (mean(blur_variances) + 0.001);
    if (blur_inconsistency > 2.0) {
        result.artifacts.push_back("inconsistent_blur");
        total += 0.15f;
    }

    cv::Mat spectrum = logMagnitudeSpectrum(gray);
    double peak_threshold = percentile(spectrum, 99.0);
    cv::Mat peaks = spectrum > peak_threshold;
    cv::Rect center_box = cv::Rect(spectrum.cols / 2 - CENTER_MARGIN, spectrum.rows / 2 - CENTER_MARGIN,
                                   2 * CENTER_MARGIN, 2 * CENTER_MARGIN) &
                          cv::Rect(0, 0, spectrum.cols, spectrum.rows);
    peaks(center_box).setTo(0);
    int periodic_peaks = cv::countNonZero(peaks);
    if (periodic_peaks > 10) {
        result.artifacts.push_back("repeating_patterns");
        total += 0.15f;
    }

    result.suspicion = std::min(total, 1.0f);
    result.suspicious = total > 0.25f;
    result.details = {
        {"background_edge_variance", background_variance},
        {"blur_inconsistency", blur_inconsistency},
        {"periodic_peaks", periodic_peaks},
        {"edge_density_std", std::sqrt(populationVariance(edge_densities))},
        {"blur_variance_std", std::sqrt(populationVariance(blur_variances))}
    };
    return result;
}

SceneConsistency SceneProbe::analyzeConsistency(const cv::Mat& image, const cv::Mat& gray) {
    SceneConsistency result;
    float score = 1.0f;

    cv::Mat lab;
    cv::cvtColor(image, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> lab_channels;
    cv::split(lab, lab_channels);
    const cv::Mat& l_channel = lab_channels[0];

    // Lighting direction spread
    cv::Mat gx, gy, magnitude, angle;
    cv::Sobel(l_channel, gx, CV_64F, 1, 0, 5);
    cv::Sobel(l_channel, gy, CV_64F, 0, 1, 5);
    cv::magnitude(gx, gy, magnitude);
    double magnitude_cut = percentile(magnitude, 70.0);
    std::vector<double> angle_hist(8, 0.0);
    long significant = 0;
    for (int y = 0; y < magnitude.rows; y++) {
        const double* mag_row = magnitude.ptr<double>(y);
        const double* gx_row = gx.ptr<double>(y);
        const double* gy_row = gy.ptr<double>(y);
        for (int x = 0; x < magnitude.cols; x++) {
            if (mag_row[x] <= magnitude_cut) {
                continue;
            }
            double theta = std::atan2(gy_row[x], gx_row[x]);
            int bin = static_cast<int>((theta + CV_PI) / (2.0 * CV_PI) * 8.0);
            angle_hist[std::min(7, std::max(0, bin))] += 1.0;
            significant++;
        }
    }
    if (significant > 100) {
        double entropy = 0.0;
        for (double count : angle_hist) {
            double p = count / significant;
            entropy -= p * std::log(p + 0.001);
        }
        double normalized = entropy / std::log(8.0);
        if (normalized > 0.85) {
            result.inconsistencies.push_back("multiple_light_sources");
            score -= 0.15f;
        }
        result.details["lighting_entropy"] = normalized;
    }

    cv::Mat shadow_mask = (l_channel < 80) & (l_channel > 20);
    if (cv::countNonZero(shadow_mask) > 500) {
        cv::Mat shadow_blurred, shadow_f, blurred_f;
        cv::GaussianBlur(shadow_mask, shadow_blurred, cv::Size(11, 11), 0);
        shadow_mask.convertTo(shadow_f, CV_64F);
        shadow_blurred.convertTo(blurred_f, CV_64F);
        double sharpness = cv::mean(cv::abs(shadow_f - blurred_f))[0];
        if (sharpness > 80) {
            result.inconsistencies.push_back("unnatural_sharp_shadows");
            score -= 0.1f;
        }
        result.details["shadow_sharpness"] = sharpness;
    }

    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);
    std::vector<cv::Vec4i> lines;
    cv::HoughLinesP(edges, lines, 1, CV_PI / 180.0, 50, 50, 10);
    if (lines.size() > 5) {
        std::vector<int> direction_hist(6, 0);
        for (const auto& line : lines) {
            double theta = std::atan2(static_cast<double>(line[3] - line[1]), static_cast<double>(line[2] - line[0]));
            if (theta < -CV_PI / 2.0 || theta > CV_PI / 2.0) {
                continue;
            }
            int bin = static_cast<int>((theta + CV_PI / 2.0) / CV_PI * 6.0);
            direction_hist[std::min(5, bin)]++;
        }
        int dominant = 0;
        for (int count : direction_hist) {
            if (count > lines.size() * 0.15) {
                dominant++;
            }
        }
        if (dominant > 3) {
            result.inconsistencies.push_back("inconsistent_perspective");
            score -= 0.15f;
        }
        result.details["line_count"] = lines.size();
        result.details["dominant_directions"] = dominant;
    }

    result.consistency = std::max(score, 0.0f);
    result.consistent = result.consistency > 0.7f;
    return result;
}

float SceneProbe::combine(const GeneratorMatch& match, float background, float consistency) {
    float ai_score = match.likely_real ? 0.0f : match.confidence;
    return ai_score * 0.5f + background * 0.25f + (1.0f - consistency) * 0.25f;
}

SceneVerdict SceneProbe::classify(float combined) {
    if (combined > AI_GENERATED_ABOVE) {
        return SceneVerdict::LIKELY_AI_GENERATED;
    }
    if (combined > SUSPICIOUS_ABOVE) {
        return SceneVerdict::SUSPICIOUS;
    }
    return SceneVerdict::LIKELY_AUTHENTIC;
}

ProbeResult SceneProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty() || input.image.channels() != 3) {
        return neutral("color_input_required");
    }

    cv::Mat image;
    int longest = std::max(input.image.cols, input.image.rows);
    if (longest > MAX_ANALYSIS_SIDE) {
        double scale = static_cast<double>(MAX_ANALYSIS_SIDE) / longest;
        cv::resize(input.image, image, cv::Size(), scale, scale, cv::INTER_AREA);
    } else {
        image = input.image;
    }
    cv::Mat gray = toGray(image);

    SignatureScore dalle = detectDalleSignature(image, gray);
    SignatureScore midjourney = detectMidjourneySignature(image, gray);
    SignatureScore stable_diffusion = detectStableDiffusionSignature(image, gray);
    SignatureScore banding = analyzeColorBanding(gray);
    SignatureScore uniformity = analyzeTextureUniformity(gray);
    float generic = (banding.score + uniformity.score) / 2.0f;

    GeneratorMatch match = pickGenerator(dalle.score, midjourney.score, stable_diffusion.score, generic);
    BackgroundResult background = analyzeBackground(gray);
    SceneConsistency scene = analyzeConsistency(image, gray);

    float combined = combine(match, background.suspicion, scene.consistency);
    SceneVerdict verdict = classify(combined);

    std::vector<std::string> signatures;
    for (const auto* family : {&dalle, &midjourney, &stable_diffusion}) {
        signatures.insert(signatures.end(), family->signatures.begin(), family->signatures.end());
    }
    std::vector<std::string> all_issues = signatures;
    all_issues.insert(all_issues.end(), background.artifacts.begin(), background.artifacts.end());
    all_issues.insert(all_issues.end(), scene.inconsistencies.begin(), scene.inconsistencies.end());

    ProbeResult result;
    result.score = combined;
    result.details = {
        {"classification", sceneVerdictToString(verdict)},
        {"combined_score", combined},
        {"ai_generator", match.generator},
        {"ai_generator_confidence", match.confidence},
        {"ai_signatures", signatures},
        {"background_suspicious", background.suspicious},
        {"background_score", background.suspicion},
        {"background_artifacts", background.artifacts},
        {"scene_consistent", scene.consistent},
        {"scene_score", scene.consistency},
        {"scene_issues", scene.inconsistencies},
        {"all_detected_issues", all_issues},
        {"details", {
            {"ai_art", {
                {"dalle", dalle.details},
                {"midjourney", midjourney.details},
                {"stable_diffusion", stable_diffusion.details},
                {"color_banding", banding.details},
                {"texture_uniformity", uniformity.details},
                {"generic_ai_score", generic}
            }},
            {"background", background.details},
            {"scene", scene.details}
        }}
    };
    return result;
}

} // namespace probes
