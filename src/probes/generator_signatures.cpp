#include "generator_signatures.hpp"
#include "image_stats.hpp"
#include <algorithm>
#include <bitset>
#include <cmath>
#include <functional>

namespace probes {

SignatureScore detectDalleSignature(const cv::Mat& image, const cv::Mat& gray) {
    SignatureScore result;
    float total = 0.0f;

    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    std::vector<cv::Mat> hsv_channels;
    cv::split(hsv, hsv_channels);
    cv::Scalar sat_mean, sat_std;
    cv::meanStdDev(hsv_channels[1], sat_mean, sat_std);
    if (sat_std[0] < 30 && sat_mean[0] > 100) {
        result.signatures.push_back("uniform_high_saturation");
        total += 0.15f;
    }

    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, magnitude);
    cv::Scalar grad_mean, grad_std;
    cv::meanStdDev(magnitude, grad_mean, grad_std);
    if (grad_std[0] > 40 && grad_mean[0] < 15) {
        result.signatures.push_back("sharp_edges_smooth_surfaces");
        total += 0.2f;
    }

    cv::Mat blurred, diff;
    cv::GaussianBlur(gray, blurred, cv::Size(21, 21), 0);
    cv::Mat gray_f, blurred_f;
    gray.convertTo(gray_f, CV_64F);
    blurred.convertTo(blurred_f, CV_64F);
    diff = cv::abs(gray_f - blurred_f);
    cv::Scalar diff_mean, diff_std;
    cv::meanStdDev(diff, diff_mean, diff_std);
    double blur_uniformity = 1.0 - diff_std[0] / (diff_mean[0] + 1.0);
    if (blur_uniformity > 0.7) {
        result.signatures.push_back("uniform_blur_pattern");
        total += 0.15f;
    }

    cv::Mat spectrum = logMagnitudeSpectrum(gray);
    int qr = spectrum.rows / 4;
    int qc = spectrum.cols / 4;
    double freq_ratio = 0.0;
    if (qr > 0 && qc > 0) {
        cv::Mat center = spectrum(cv::Rect(qc, qr, spectrum.cols - 2 * qc, spectrum.rows - 2 * qr));
        double center_energy = cv::mean(center)[0];
        double total_energy = cv::mean(spectrum)[0];
        freq_ratio = center_energy / (total_energy + 0.001);
        if (freq_ratio > 1.5) {
            result.signatures.push_back("unusual_frequency_distribution");
            total += 0.1f;
        }
    }

    result.score = std::min(total, 1.0f);
    result.details = {
        {"saturation_mean", sat_mean[0]},
        {"saturation_std", sat_std[0]},
        {"gradient_std", grad_std[0]},
        {"blur_uniformity", blur_uniformity},
        {"freq_ratio", freq_ratio},
        {"signatures", result.signatures}
    };
    return result;
}

SignatureScore detectMidjourneySignature(const cv::Mat& image, const cv::Mat& gray) {
    SignatureScore result;
    float total = 0.0f;

    cv::Mat lab;
    cv::cvtColor(image, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> lab_channels;
    cv::split(lab, lab_channels);
    cv::Scalar l_mean, l_std;
    cv::meanStdDev(lab_channels[0], l_mean, l_std);
    double l_min, l_max;
    cv::minMaxLoc(lab_channels[0], &l_min, &l_max);
    double l_range = l_max - l_min;
    if (l_std[0] > 60 && l_range > 200) {
        result.signatures.push_back("dramatic_lighting");
        total += 0.15f;
    }

    cv::Mat kernel_h = cv::getGaborKernel(cv::Size(7, 7), 3.0, 0.0, 5.0, 0.5, 0.0, CV_64F);
    cv::Mat kernel_v = cv::getGaborKernel(cv::Size(7, 7), 3.0, CV_PI / 2.0, 5.0, 0.5, 0.0, CV_64F);
    cv::Mat filtered_h, filtered_v;
    cv::filter2D(gray, filtered_h, CV_64F, kernel_h);
    cv::filter2D(gray, filtered_v, CV_64F, kernel_v);
    double texture_energy = cv::mean(cv::abs(filtered_h))[0] + cv::mean(cv::abs(filtered_v))[0];
    if (texture_energy > 20) {
        result.signatures.push_back("painterly_texture");
        total += 0.2f;
    }

    cv::Mat hsv;
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);
    std::vector<double> hue_hist(18, 0.0);
    for (int y = 0; y < hsv.rows; y++) {
        const cv::Vec3b* row = hsv.ptr<cv::Vec3b>(y);
        for (int x = 0; x < hsv.cols; x++) {
            hue_hist[std::min(17, row[x][0] / 10)] += 1.0;
        }
    }
    double hue_total = static_cast<double>(hsv.total());
    for (double& bin : hue_hist) {
        bin /= hue_total;
    }
    std::sort(hue_hist.begin(), hue_hist.end(), std::greater<double>());
    double top3 = hue_hist[0] + hue_hist[1] + hue_hist[2];
    if (top3 > 0.5) {
        result.signatures.push_back("concentrated_color_palette");
        total += 0.15f;
    }

    double vignette = brightnessDistanceCorrelation(gray);
    if (vignette < -0.2) {
        result.signatures.push_back("artistic_vignetting");
        total += 0.1f;
    }

    result.score = std::min(total, 1.0f);
    result.details = {
        {"lighting_std", l_std[0]},
        {"lighting_range", l_range},
        {"texture_energy", texture_energy},
        {"color_concentration", top3},
        {"vignetting_correlation", vignette},
        {"signatures", result.signatures}
    };
    return result;
}

SignatureScore detectStableDiffusionSignature(const cv::Mat& image, const cv::Mat& gray) {
    SignatureScore result;
    float total = 0.0f;

    cv::Mat gray_f, blurred_f, blurred;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    gray.convertTo(gray_f, CV_64F);
    blurred.convertTo(blurred_f, CV_64F);
    cv::Mat noise = gray_f - blurred_f;

    cv::Scalar noise_mean, noise_std;
    cv::meanStdDev(noise, noise_mean, noise_std);
    cv::Mat centered = noise - noise_mean[0];
    cv::Mat squared = centered.mul(centered);
    double fourth_moment = cv::mean(squared.mul(squared))[0];
    double kurtosis = fourth_moment / (std::pow(noise_std[0], 4) + 0.001);
    if (noise_std[0] > 2.5 && noise_std[0] < 8 && kurtosis > 3.5) {
        result.signatures.push_back("sd_noise_pattern");
        total += 0.2f;
    }

    cv::Mat edges, edge_region;
    cv::Canny(gray, edges, 50, 150);
    cv::dilate(edges, edge_region, cv::Mat::ones(5, 5, CV_8U), cv::Point(-1, -1), 2);
    double noise_ratio = 0.0;
    if (cv::countNonZero(edge_region) > 0) {
        cv::Scalar edge_mean, edge_std, flat_mean, flat_std;
        cv::meanStdDev(noise, edge_mean, edge_std, edge_region);
        cv::Mat flat_region = edge_region == 0;
        double flat_noise = 0.0;
        if (cv::countNonZero(flat_region) > 0) {
            cv::meanStdDev(noise, flat_mean, flat_std, flat_region);
            flat_noise = flat_std[0];
        }
        noise_ratio = edge_std[0] / (flat_noise + 0.001);
        if (noise_ratio > 1.5) {
            result.signatures.push_back("edge_artifacts");
            total += 0.15f;
        }
    }

    // Autocorrelation through the power spectrum
    cv::Mat planes[] = {gray_f.clone(), cv::Mat::zeros(gray_f.size(), CV_64F)};
    cv::Mat complex_img;
    cv::merge(planes, 2, complex_img);
    cv::dft(complex_img, complex_img, cv::DFT_COMPLEX_OUTPUT);
    cv::split(complex_img, planes);
    cv::Mat power = planes[0].mul(planes[0]) + planes[1].mul(planes[1]);
    cv::Mat autocorr;
    cv::idft(power, autocorr, cv::DFT_REAL_OUTPUT | cv::DFT_SCALE);
    fftShift(autocorr);
    double ac_min, ac_max;
    cv::minMaxLoc(autocorr, &ac_min, &ac_max);
    double max_sidelobe = 0.0;
    if (ac_max > 0.0) {
        autocorr /= ac_max;
        int cx = autocorr.cols / 2;
        int cy = autocorr.rows / 2;
        cv::Rect center_box = cv::Rect(cx - 20, cy - 20, 40, 40) & cv::Rect(0, 0, autocorr.cols, autocorr.rows);
        autocorr(center_box).setTo(0.0);
        cv::minMaxLoc(autocorr, &ac_min, &max_sidelobe);
        if (max_sidelobe > 0.3) {
            result.signatures.push_back("repetitive_patterns");
            total += 0.15f;
        }
    }

    cv::Mat lab;
    cv::cvtColor(image, lab, cv::COLOR_BGR2Lab);
    std::bitset<256> l_values;
    long skin_pixels = 0;
    for (int y = 0; y < lab.rows; y++) {
        const cv::Vec3b* row = lab.ptr<cv::Vec3b>(y);
        for (int x = 0; x < lab.cols; x++) {
            const cv::Vec3b& px = row[x];
            if (px[1] > 125 && px[1] < 145 && px[2] > 130 && px[2] < 155) {
                skin_pixels++;
                l_values.set(px[0]);
            }
        }
    }
    if (skin_pixels > 1000 && l_values.count() < 50) {
        result.signatures.push_back("skin_color_quantization");
        total += 0.1f;
    }

    result.score = std::min(total, 1.0f);
    result.details = {
        {"noise_std", noise_std[0]},
        {"noise_kurtosis", kurtosis},
        {"edge_noise_ratio", noise_ratio},
        {"max_autocorr_sidelobe", max_sidelobe},
        {"signatures", result.signatures}
    };
    return result;
}

SignatureScore analyzeColorBanding(const cv::Mat& gray) {
    SignatureScore result;
    cv::Mat edges;
    cv::Canny(gray, edges, 10, 30);

    cv::Mat smooth_mask = localVariance(gray, 15) < 100.0;
    int total_smooth = cv::countNonZero(smooth_mask);
    cv::Mat smooth_edges;
    cv::bitwise_and(edges, smooth_mask, smooth_edges);
    int edges_in_smooth = cv::countNonZero(smooth_edges);

    double banding_ratio = total_smooth > 0 ? static_cast<double>(edges_in_smooth) / total_smooth : 0.0;
    result.score = static_cast<float>(std::min(banding_ratio * 50.0, 1.0));
    result.details = {
        {"edges_in_smooth_areas", edges_in_smooth},
        {"smooth_area_pixels", total_smooth},
        {"banding_ratio", banding_ratio}
    };
    return result;
}

SignatureScore analyzeTextureUniformity(const cv::Mat& gray) {
    SignatureScore result;
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar lap_mean, lap_std;
    cv::meanStdDev(laplacian, lap_mean, lap_std);
    double texture_var = lap_std[0] * lap_std[0];

    std::string assessment;
    if (texture_var < 200) {
        result.score = static_cast<float>(0.7 - (texture_var / 200.0) * 0.3);
        assessment = "too_smooth";
    } else if (texture_var > 5000) {
        result.score = 0.3f;
        assessment = "too_noisy";
    } else {
        result.score = 0.1f;
        assessment = "normal";
    }
    result.details = {
        {"texture_variance", texture_var},
        {"texture_mean", cv::mean(cv::abs(laplacian))[0]},
        {"assessment", assessment}
    };
    return result;
}

} // namespace probes
