#ifndef FRAME_SET_BUILDER_HPP
#define FRAME_SET_BUILDER_HPP

#include "media_types.hpp"
#include "detection_config.hpp"
#include "region_extractor.hpp"
#include <string>
#include <vector>

// One detected face with its square crop and the suspicion values that scale its color/noise votes
struct FaceRegion {
    FaceInfo face;
    int rank = 0;             // position among the kept faces; drives vote weight and frame names
    cv::Mat crop;
    float color_suspicion = 0.0f;
    float noise_suspicion = 0.0f;
};

// A sampled video frame and the faces found in it
struct VideoSample {
    cv::Mat frame;
    int frame_index = 0;
    std::vector<FaceInfo> faces;
    std::vector<cv::Mat> crops;
};

// Decides which frames are sent to the classifier and at what vote weight
class FrameSetBuilder {
public:
    FrameSetBuilder(const DetectionConfig& config, const RegionExtractor& extractor);

    std::vector<AnalysisFrame> buildImageFrames(const cv::Mat& image, const std::vector<FaceRegion>& faces) const;
    std::vector<AnalysisFrame> buildVideoFrames(const std::vector<VideoSample>& samples) const;

    // 5.0 - 0.3 * index
    static float faceBaseWeight(int face_index);
    // Full weight at scale 1.0, otherwise max(base * scale * 0.8, 2.0)
    static float multiScaleWeight(float base, double scale);

    static constexpr float FACE_FFT_WEIGHT = 3.0f;
    static constexpr float FACE_COLOR_WEIGHT = 1.2f;
    static constexpr float EYES_WEIGHT = 3.5f;
    static constexpr float EYES_EDGE_WEIGHT = 2.0f;
    static constexpr float MOUTH_WEIGHT = 3.0f;
    static constexpr float FACE_EDGES_WEIGHT = 2.5f;
    static constexpr float FACE_SHARP_WEIGHT = 1.5f;
    static constexpr float FULL_WEIGHT_WITH_FACES = 1.0f;
    static constexpr float FULL_WEIGHT_NO_FACES = 3.0f;
    static constexpr float FULL_FFT_WEIGHT = 1.5f;
    static constexpr float EDGES_WEIGHT = 1.0f;
    static constexpr float CONTRAST_WEIGHT = 0.8f;
    static constexpr float MIRROR_WEIGHT = 1.0f;
    static constexpr double CONTRAST_FACTOR = 1.3;

private:
    const DetectionConfig& config_;
    const RegionExtractor& extractor_;

    void addFaceFrames(std::vector<AnalysisFrame>& frames, const FaceRegion& region) const;
    void addCenterFrames(std::vector<AnalysisFrame>& frames, const cv::Mat& image) const;

    static void push(std::vector<AnalysisFrame>& frames, cv::Mat image, const std::string& name,
                     FrameKind kind, float weight, int face_index = -1, int video_frame = -1);
};

#endif // FRAME_SET_BUILDER_HPP
