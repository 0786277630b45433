#ifndef FACE_LOCATOR_HPP
#define FACE_LOCATOR_HPP

#include "media_types.hpp"
#include "detection_config.hpp"
#include <opencv2/opencv.hpp>
#include <mutex>
#include <string>
#include <vector>

// Haar cascade face detection with an ordered list of parameter sets.
// The first parameter set that finds anything wins, even if a later one would find more.
class FaceLocator {
public:
    explicit FaceLocator(const DetectionConfig& config);
    virtual ~FaceLocator() = default;

    // Loads the first available cascade, searching models_path before the system OpenCV data dirs
    bool initialize(const std::string& models_path = "");

    bool isInitialized() const { return initialized_; }

    virtual std::vector<FaceInfo> detectFaces(const cv::Mat& frame);

    // (size_score + aspect_score) / 2
    static float scoreDetection(int width, int height);

    // Maps a box found on a frame resized by `scale` back to original pixels.
    // Both corners are rounded, so adjacent boxes stay adjacent.
    static cv::Rect rescaleBox(const cv::Rect& box, double scale, const cv::Size& bounds);

protected:
    DetectionConfig config_;

private:
    cv::CascadeClassifier cascade_;
    std::mutex cascade_mutex_;
    bool initialized_;
    std::string cascade_path_;

    std::vector<std::string> candidatePaths(const std::string& models_path) const;
};

#endif // FACE_LOCATOR_HPP
