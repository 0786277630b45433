#include "region_extractor.hpp"
#include "probes/image_stats.hpp"
#include "probes/noise_pattern_probe.hpp"

RegionExtractor::RegionExtractor(const DetectionConfig& config)
    : optimal_size_(config.optimal_size),
      face_margin_(config.face_margin),
      enhance_crops_(config.enhance_face_crops) {
}

cv::Mat RegionExtractor::toBgr(const cv::Mat& image) {
    if (image.channels() == 3) {
        return image;
    }
    cv::Mat bgr;
    cv::cvtColor(image, bgr, image.channels() == 4 ? cv::COLOR_BGRA2BGR : cv::COLOR_GRAY2BGR);
    return bgr;
}

cv::Mat RegionExtractor::square(const cv::Mat& image) const {
    cv::Mat resized;
    cv::resize(toBgr(image), resized, cv::Size(optimal_size_, optimal_size_), 0, 0, cv::INTER_LANCZOS4);
    return resized;
}

cv::Rect RegionExtractor::marginRect(const cv::Rect& bbox, double margin, const cv::Size& bounds) {
    int margin_x = static_cast<int>(bbox.width * margin);
    int margin_y = static_cast<int>(bbox.height * margin);

    int left = std::max(0, bbox.x - margin_x);
    int top = std::max(0, bbox.y - margin_y);
    int right = std::min(bounds.width, bbox.x + bbox.width + margin_x);
    int bottom = std::min(bounds.height, bbox.y + bbox.height + margin_y);
    return cv::Rect(left, top, std::max(0, right - left), std::max(0, bottom - top));
}

cv::Mat RegionExtractor::cropFace(const cv::Mat& image, const FaceInfo& face) const {
    cv::Rect rect = marginRect(face.bbox, face_margin_, image.size());
    if (rect.area() == 0) {
        return cv::Mat();
    }
    cv::Mat crop = square(image(rect));
    return enhance_crops_ ? enhance(crop) : crop;
}

cv::Mat RegionExtractor::enhance(const cv::Mat& crop) {
    cv::Mat denoised;
    cv::bilateralFilter(crop, denoised, 5, 50, 50);

    cv::Mat lab;
    cv::cvtColor(denoised, lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
    clahe->apply(channels[0], channels[0]);
    cv::merge(channels, lab);
    cv::Mat equalized;
    cv::cvtColor(lab, equalized, cv::COLOR_Lab2BGR);

    cv::Mat blurred, sharpened;
    cv::GaussianBlur(equalized, blurred, cv::Size(0, 0), 1.0);
    cv::addWeighted(equalized, 1.5, blurred, -0.5, 0, sharpened);
    return sharpened;
}

cv::Rect RegionExtractor::eyeRect(const cv::Size& size) {
    int top = static_cast<int>(size.height * 0.2);
    int bottom = static_cast<int>(size.height * 0.45);
    int left = static_cast<int>(size.width * 0.1);
    int right = static_cast<int>(size.width * 0.9);
    return cv::Rect(left, top, right - left, bottom - top);
}

cv::Rect RegionExtractor::mouthRect(const cv::Size& size) {
    int top = static_cast<int>(size.height * 0.55);
    int bottom = static_cast<int>(size.height * 0.85);
    int left = static_cast<int>(size.width * 0.2);
    int right = static_cast<int>(size.width * 0.8);
    return cv::Rect(left, top, right - left, bottom - top);
}

cv::Mat RegionExtractor::eyeStrip(const cv::Mat& crop) const {
    cv::Rect rect = eyeRect(crop.size());
    return rect.area() > 0 ? square(crop(rect)) : cv::Mat();
}

cv::Mat RegionExtractor::mouthStrip(const cv::Mat& crop) const {
    cv::Rect rect = mouthRect(crop.size());
    return rect.area() > 0 ? square(crop(rect)) : cv::Mat();
}

cv::Mat RegionExtractor::edgeMap(const cv::Mat& image) const {
    cv::Mat gray = probes::toGray(image);
    cv::Mat gx, gy, magnitude, edges;
    cv::Sobel(gray, gx, CV_32F, 1, 0);
    cv::Sobel(gray, gy, CV_32F, 0, 1);
    cv::magnitude(gx, gy, magnitude);
    cv::convertScaleAbs(magnitude, edges);
    return square(edges);
}

cv::Mat RegionExtractor::sharpened(const cv::Mat& image) const {
    cv::Mat kernel = (cv::Mat_<float>(3, 3) << -2, -2, -2, -2, 32, -2, -2, -2, -2) / 16.0f;
    cv::Mat once, twice;
    cv::filter2D(toBgr(image), once, -1, kernel);
    cv::filter2D(once, twice, -1, kernel);
    return square(twice);
}

cv::Mat RegionExtractor::rescaled(const cv::Mat& crop, double scale) const {
    int scaled_size = static_cast<int>(optimal_size_ * scale);
    if (scaled_size <= 0) {
        return cv::Mat();
    }
    cv::Mat scaled;
    cv::resize(crop, scaled, cv::Size(scaled_size, scaled_size), 0, 0, cv::INTER_LANCZOS4);
    return square(scaled);
}

cv::Mat RegionExtractor::frequencyMap(const cv::Mat& image) const {
    cv::Mat spectrum = probes::logMagnitudeSpectrum(probes::toGray(image));
    double min_val, max_val;
    cv::minMaxLoc(spectrum, &min_val, &max_val);
    cv::Mat normalized;
    spectrum.convertTo(normalized, CV_8U, max_val > 0 ? 255.0 / max_val : 0.0);
    return square(normalized);
}

cv::Mat RegionExtractor::colorMap(const cv::Mat& image) const {
    cv::Mat lab;
    cv::cvtColor(toBgr(image), lab, cv::COLOR_BGR2Lab);
    std::vector<cv::Mat> channels;
    cv::split(lab, channels);
    cv::equalizeHist(channels[0], channels[0]);
    cv::merge(channels, lab);
    cv::Mat enhanced;
    cv::cvtColor(lab, enhanced, cv::COLOR_Lab2BGR);
    return square(enhanced);
}

cv::Mat RegionExtractor::noiseMap(const cv::Mat& image) const {
    cv::Mat noise = probes::NoisePatternProbe::residual(image);
    double min_val, max_val;
    cv::minMaxLoc(noise, &min_val, &max_val);
    cv::Mat normalized;
    noise.convertTo(normalized, CV_8U, 255.0 / (max_val - min_val + 1e-8),
                    -min_val * 255.0 / (max_val - min_val + 1e-8));
    return square(normalized);
}

cv::Mat RegionExtractor::centerCrop(const cv::Mat& image, double fraction) const {
    int mx = static_cast<int>(image.cols * (1.0 - fraction) / 2.0);
    int my = static_cast<int>(image.rows * (1.0 - fraction) / 2.0);
    cv::Rect rect(mx, my, image.cols - 2 * mx, image.rows - 2 * my);
    if (rect.area() <= 0) {
        return square(image);
    }
    return square(image(rect));
}

cv::Mat RegionExtractor::contrastEnhanced(const cv::Mat& image, double factor) const {
    double gray_mean = cv::mean(probes::toGray(image))[0];
    cv::Mat enhanced;
    toBgr(image).convertTo(enhanced, -1, factor, gray_mean * (1.0 - factor));
    return square(enhanced);
}

cv::Mat RegionExtractor::mirrored(const cv::Mat& image) const {
    cv::Mat flipped;
    cv::flip(image, flipped, 1);
    return square(flipped);
}
