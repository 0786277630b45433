#ifndef MEDIA_TYPES_HPP
#define MEDIA_TYPES_HPP

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

enum class MediaType {
    IMAGE,
    VIDEO
};

std::string mediaTypeToString(MediaType type);

struct FaceInfo {
    cv::Rect bbox;            // original-image pixel space
    float confidence = 0.0f;
    int index = 0;            // raw cascade detection order, gaps left by confidence filtering

    int size() const { return bbox.width * bbox.height; }
    cv::Point center() const { return cv::Point(bbox.x + bbox.width / 2, bbox.y + bbox.height / 2); }
};

// What a generated frame depicts. Drives channel membership in the aggregator.
enum class FrameKind {
    FACE,
    FACE_FFT,
    FACE_COLOR,
    FACE_NOISE,
    EYES,
    EYES_EDGE,
    MOUTH,
    FACE_EDGES,
    FACE_SHARP,
    FULL,
    FULL_FFT,
    CENTER,
    CENTER_FFT,
    EDGES,
    CONTRAST,
    MIRROR,
    VIDEO_FRAME
};

std::string frameKindToString(FrameKind kind);
bool isFrequencyFrame(FrameKind kind);
bool isEyeFrame(FrameKind kind);
bool isFaceAppearanceFrame(FrameKind kind);

struct AnalysisFrame {
    cv::Mat image;            // BGR, square for classifier input
    std::string name;
    FrameKind kind = FrameKind::FULL;
    float weight = 1.0f;
    int face_index = -1;      // -1 when not face-derived
    int video_frame = -1;     // sample index for video frames
};

// Classifier output for one frame; fake + real == 1
struct FrameScore {
    float fake = 0.0f;
    float real = 0.0f;
};

struct AggregateScores {
    double fake = 0.0;
    double real = 0.0;
};

enum class Classification {
    REAL,
    SUSPICIOUS,
    FAKE
};

std::string classificationToString(Classification classification);

// Decoded media handed to the analyzer. Images carry their raw bytes for metadata probes.
struct DecodedMedia {
    MediaType type = MediaType::IMAGE;
    std::vector<cv::Mat> frames;
    std::vector<int> frame_indices;
    std::vector<unsigned char> raw_bytes;
    double fps = 0.0;
    int total_frames = 0;
    std::string source;
};

#endif // MEDIA_TYPES_HPP
