#ifndef REGION_EXTRACTOR_HPP
#define REGION_EXTRACTOR_HPP

#include "media_types.hpp"
#include "detection_config.hpp"
#include <opencv2/opencv.hpp>

// Derived sub-images and analysis images. Every output is a BGR square of optimal size.
class RegionExtractor {
public:
    explicit RegionExtractor(const DetectionConfig& config);

    // Margin crop around the face, clamped to the image, enhanced when configured
    cv::Mat cropFace(const cv::Mat& image, const FaceInfo& face) const;

    // Crop rectangle before resizing
    static cv::Rect marginRect(const cv::Rect& bbox, double margin, const cv::Size& bounds);

    // Vertical band [0.20h, 0.45h], horizontal [0.1w, 0.9w]
    static cv::Rect eyeRect(const cv::Size& size);
    // Vertical band [0.55h, 0.85h], horizontal [0.2w, 0.8w]
    static cv::Rect mouthRect(const cv::Size& size);

    cv::Mat eyeStrip(const cv::Mat& crop) const;
    cv::Mat mouthStrip(const cv::Mat& crop) const;
    cv::Mat edgeMap(const cv::Mat& image) const;
    cv::Mat sharpened(const cv::Mat& image) const;
    cv::Mat rescaled(const cv::Mat& crop, double scale) const;
    cv::Mat frequencyMap(const cv::Mat& image) const;
    cv::Mat colorMap(const cv::Mat& image) const;
    cv::Mat noiseMap(const cv::Mat& image) const;

    cv::Mat centerCrop(const cv::Mat& image, double fraction) const;
    cv::Mat contrastEnhanced(const cv::Mat& image, double factor) const;
    cv::Mat mirrored(const cv::Mat& image) const;
    cv::Mat square(const cv::Mat& image) const;

    // Bilateral denoise, CLAHE on lightness, unsharp mask
    static cv::Mat enhance(const cv::Mat& crop);

    int optimalSize() const { return optimal_size_; }

private:
    int optimal_size_;
    double face_margin_;
    bool enhance_crops_;

    static cv::Mat toBgr(const cv::Mat& image);
};

#endif // REGION_EXTRACTOR_HPP
