#include "frame_set_builder.hpp"
#include <algorithm>
#include <cmath>

namespace {

struct CenterCrop {
    int percent;
    float weight;
};

// Tighter crops vote more; their frequency maps vote at half weight
const CenterCrop CENTER_CROPS[] = {{35, 4.5f}, {45, 4.0f}, {55, 3.5f}, {65, 3.0f}};

const float VIDEO_FACE_EDGE_WEIGHT = 3.5f;
const float VIDEO_FACE_WEIGHT = 2.5f;
const float VIDEO_FFT_FACTOR = 0.6f;
const float VIDEO_EYES_FACTOR = 0.8f;
const float VIDEO_FRAME_EDGE_WEIGHT = 2.0f;
const float VIDEO_FRAME_WEIGHT = 1.5f;

}

FrameSetBuilder::FrameSetBuilder(const DetectionConfig& config, const RegionExtractor& extractor)
    : config_(config), extractor_(extractor) {
}

float FrameSetBuilder::faceBaseWeight(int face_index) {
    return 5.0f - 0.3f * static_cast<float>(face_index);
}

float FrameSetBuilder::multiScaleWeight(float base, double scale) {
    if (scale >= 1.0) {
        return base;
    }
    return std::max(static_cast<float>(base * scale * 0.8), 2.0f);
}

void FrameSetBuilder::push(std::vector<AnalysisFrame>& frames, cv::Mat image, const std::string& name,
                           FrameKind kind, float weight, int face_index, int video_frame) {
    if (image.empty() || weight <= 0.0f) {
        return;
    }
    AnalysisFrame frame;
    frame.image = std::move(image);
    frame.name = name;
    frame.kind = kind;
    frame.weight = weight;
    frame.face_index = face_index;
    frame.video_frame = video_frame;
    frames.push_back(std::move(frame));
}

void FrameSetBuilder::addFaceFrames(std::vector<AnalysisFrame>& frames, const FaceRegion& region) const {
    if (region.crop.empty()) {
        return;
    }

    const int index = region.rank;
    const std::string prefix = "face" + std::to_string(index + 1);
    const float base = faceBaseWeight(index);

    for (double scale : config_.multi_scale_sizes) {
        if (static_cast<int>(extractor_.optimalSize() * scale) < config_.min_scaled_size) {
            continue;
        }
        cv::Mat scaled = scale >= 1.0 ? region.crop : extractor_.rescaled(region.crop, scale);
        push(frames, scaled, prefix + "_s" + std::to_string(static_cast<int>(std::lround(scale * 100))),
             FrameKind::FACE, multiScaleWeight(base, scale), index);
    }

    push(frames, extractor_.frequencyMap(region.crop), prefix + "_fft", FrameKind::FACE_FFT, FACE_FFT_WEIGHT, index);
    push(frames, extractor_.colorMap(region.crop), prefix + "_color", FrameKind::FACE_COLOR,
         FACE_COLOR_WEIGHT * (1.0f + region.color_suspicion), index);
    push(frames, extractor_.noiseMap(region.crop), prefix + "_noise", FrameKind::FACE_NOISE,
         1.0f + region.noise_suspicion, index);

    cv::Mat eyes = extractor_.eyeStrip(region.crop);
    push(frames, eyes, prefix + "_eyes", FrameKind::EYES, EYES_WEIGHT, index);
    if (!eyes.empty()) {
        push(frames, extractor_.edgeMap(eyes), prefix + "_eyes_edge", FrameKind::EYES_EDGE, EYES_EDGE_WEIGHT, index);
    }
    push(frames, extractor_.mouthStrip(region.crop), prefix + "_mouth", FrameKind::MOUTH, MOUTH_WEIGHT, index);
    push(frames, extractor_.edgeMap(region.crop), prefix + "_edges", FrameKind::FACE_EDGES, FACE_EDGES_WEIGHT, index);
    push(frames, extractor_.sharpened(region.crop), prefix + "_sharp", FrameKind::FACE_SHARP, FACE_SHARP_WEIGHT, index);
}

void FrameSetBuilder::addCenterFrames(std::vector<AnalysisFrame>& frames, const cv::Mat& image) const {
    for (const CenterCrop& crop : CENTER_CROPS) {
        const std::string name = "center_" + std::to_string(crop.percent);
        cv::Mat center = extractor_.centerCrop(image, crop.percent / 100.0);
        push(frames, center, name, FrameKind::CENTER, crop.weight);
        push(frames, extractor_.frequencyMap(center), name + "_fft", FrameKind::CENTER_FFT, crop.weight * 0.5f);
    }
}

std::vector<AnalysisFrame> FrameSetBuilder::buildImageFrames(const cv::Mat& image,
                                                             const std::vector<FaceRegion>& faces) const {
    std::vector<AnalysisFrame> frames;
    if (image.empty()) {
        return frames;
    }

    for (const FaceRegion& region : faces) {
        addFaceFrames(frames, region);
    }

    if (faces.empty()) {
        addCenterFrames(frames, image);
    }

    push(frames, extractor_.square(image), "full", FrameKind::FULL,
         faces.empty() ? FULL_WEIGHT_NO_FACES : FULL_WEIGHT_WITH_FACES);
    push(frames, extractor_.frequencyMap(image), "full_fft", FrameKind::FULL_FFT, FULL_FFT_WEIGHT);
    push(frames, extractor_.edgeMap(image), "edges", FrameKind::EDGES, EDGES_WEIGHT);
    push(frames, extractor_.contrastEnhanced(image, CONTRAST_FACTOR), "contrast", FrameKind::CONTRAST, CONTRAST_WEIGHT);

    if (faces.size() == 1) {
        push(frames, extractor_.mirrored(image), "mirror", FrameKind::MIRROR, MIRROR_WEIGHT);
    }

    return frames;
}

std::vector<AnalysisFrame> FrameSetBuilder::buildVideoFrames(const std::vector<VideoSample>& samples) const {
    std::vector<AnalysisFrame> frames;

    for (size_t j = 0; j < samples.size(); ++j) {
        const VideoSample& sample = samples[j];
        const int sample_index = static_cast<int>(j);
        const bool edge_sample = j == 0 || j + 1 == samples.size();

        bool has_crop = false;
        for (size_t k = 0; k < sample.faces.size() && k < sample.crops.size(); ++k) {
            has_crop = has_crop || !sample.crops[k].empty();
        }
        // Samples whose faces all cropped to nothing still vote with the whole frame
        if (!has_crop) {
            push(frames, extractor_.square(sample.frame), "frame_" + std::to_string(j + 1), FrameKind::VIDEO_FRAME,
                 edge_sample ? VIDEO_FRAME_EDGE_WEIGHT : VIDEO_FRAME_WEIGHT, -1, sample_index);
            continue;
        }

        const float face_weight = edge_sample ? VIDEO_FACE_EDGE_WEIGHT : VIDEO_FACE_WEIGHT;
        for (size_t k = 0; k < sample.faces.size() && k < sample.crops.size(); ++k) {
            const cv::Mat& crop = sample.crops[k];
            if (crop.empty()) {
                continue;
            }
            const int face_index = static_cast<int>(k);
            const std::string name = "f" + std::to_string(j + 1) + "_face" + std::to_string(k + 1);

            push(frames, crop, name, FrameKind::FACE, face_weight, face_index, sample_index);
            if (j % 2 == 0) {
                push(frames, extractor_.frequencyMap(crop), name + "_fft", FrameKind::FACE_FFT,
                     face_weight * VIDEO_FFT_FACTOR, face_index, sample_index);
            }
            if (edge_sample) {
                push(frames, extractor_.eyeStrip(crop), name + "_eyes", FrameKind::EYES,
                     face_weight * VIDEO_EYES_FACTOR, face_index, sample_index);
            }
        }
    }

    return frames;
}
