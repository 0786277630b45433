#ifndef VIDEO_CONSISTENCY_HPP
#define VIDEO_CONSISTENCY_HPP

#include "media_types.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

struct MotionBlurResult {
    int frame_index = 0;
    float blur_score = 0.0f;                // Laplacian variance / 1000, capped at 1
    std::optional<float> blur_direction;    // degrees
    bool is_natural = true;
    std::vector<std::string> issues;
};

struct FaceTrackResult {
    int face_id = 0;                        // rank by size within each sample
    std::vector<cv::Rect> positions;
    std::vector<int> sample_indices;
    float consistency_score = 1.0f;
    float velocity_variance = 0.0f;
    std::vector<std::string> issues;
};

struct LipActivityResult {
    float sync_score = 1.0f;
    bool is_synced = true;
    float openness_variance = 0.0f;
    float activity_variance = 0.0f;
    std::vector<std::string> issues;
};

struct VideoConsistencyReport {
    double motion_score = 1.0;
    double face_score = 1.0;
    double lip_score = 1.0;
    double overall = 1.0;
    bool is_consistent = true;
    std::vector<MotionBlurResult> motion;
    std::vector<FaceTrackResult> face_tracks;
    std::optional<LipActivityResult> lip_activity;
    std::vector<std::string> issues;        // unique, sorted
};

void to_json(json& j, const MotionBlurResult& r);
void to_json(json& j, const FaceTrackResult& r);
void to_json(json& j, const LipActivityResult& r);
void to_json(json& j, const VideoConsistencyReport& report);

// Cross-sample consistency of a sampled video: motion blur, face track and mouth activity
class VideoConsistencyAnalyzer {
public:
    // faces[j] are the detections of frames[j]
    VideoConsistencyReport analyze(const std::vector<cv::Mat>& frames,
                                   const std::vector<std::vector<FaceInfo>>& faces) const;

    std::vector<MotionBlurResult> analyzeMotionBlur(const std::vector<cv::Mat>& frames) const;
    std::vector<FaceTrackResult> trackFaces(const std::vector<std::vector<FaceInfo>>& faces) const;
    std::optional<LipActivityResult> analyzeLipActivity(const std::vector<cv::Mat>& frames,
                                                        const FaceTrackResult& track) const;

    static float blurScore(const cv::Mat& frame);
    static std::optional<float> blurDirection(const cv::Mat& frame);
    static cv::Rect lipRect(const cv::Rect& face);

private:
    static constexpr double MOTION_WEIGHT = 0.3;
    static constexpr double FACE_WEIGHT = 0.4;
    static constexpr double LIP_WEIGHT = 0.3;
    static constexpr double ISSUE_PENALTY = 0.05;
    static constexpr double MAX_ISSUE_PENALTY = 0.3;
    static constexpr float SUDDEN_BLUR_CHANGE = 0.5f;
    static constexpr float POSITION_JUMP = 50.0f;
    static constexpr int MAX_TRACKED_FACES = 5;
    static constexpr int MIN_TRACK_LENGTH = 3;
    static constexpr int MIN_MOUTH_SAMPLES = 5;
};

#endif // VIDEO_CONSISTENCY_HPP
