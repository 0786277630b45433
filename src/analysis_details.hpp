#ifndef ANALYSIS_DETAILS_HPP
#define ANALYSIS_DETAILS_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

struct FrameBreakdown {
    std::string name;
    std::string type;
    float weight = 0.0f;
    float fake = 0.0f;
    float real = 0.0f;
    bool fake_vote = false;
    int face_index = -1;
    int video_frame = -1;
};

// Everything one classification call reports besides the verdict.
// Optional fields serialize as null: a boost that was never evaluated is null.
struct AnalysisDetails {
    std::string media_type;
    std::string content_type;          // portrait, group or scene

    // Weighted vote
    int total_frames = 0;
    int fake_votes = 0;
    int real_votes = 0;
    double vote_ratio = 0.0;
    double total_weight = 0.0;
    double weighted_fake = 0.0;
    double weighted_real = 0.0;
    bool aggregation_fallback = false;

    // Faces and channels
    int faces_detected = 0;
    std::vector<double> face_scores;   // mean appearance score per face, in detection order
    std::optional<double> avg_face_score;
    std::optional<double> avg_fft_score;
    std::optional<double> avg_eye_score;

    // Probe outputs, keyed by probe name
    json probe_analyses = json::object();
    bool has_filter = false;
    double filter_intensity = 0.0;
    bool is_screen_content = false;
    double screen_confidence = 0.0;
    bool is_stylized = false;
    std::optional<std::string> style_type;

    // Boosts, in pipeline order
    std::optional<double> temporal_boost;
    std::optional<double> temporal_variance;
    std::optional<double> video_consistency_boost;
    std::optional<json> video_consistency;
    std::optional<double> fft_boost;
    std::optional<double> eye_boost;
    std::optional<double> multi_face_variance;
    std::optional<double> multi_face_boost;
    std::optional<double> filter_compensation;
    std::optional<double> gan_fingerprint_boost;
    std::optional<double> screen_compensation;
    std::optional<std::string> noface_branch;
    std::optional<std::string> scene_classification;
    std::optional<double> scene_boost;
    std::optional<double> stylization_boost;
    std::optional<double> double_compression_boost;
    std::optional<double> editing_software_boost;
    std::optional<double> metadata_stripped_boost;
    std::optional<double> blending_boost;
    std::optional<double> phase1_boost;
    std::optional<double> landmark_boost;
    std::optional<double> smooth_texture_boost;
    std::optional<double> ensemble_disagreement;
    std::optional<double> ensemble_boost;
    std::optional<double> phase2_boost;

    double pre_clamp_fake = 0.0;

    std::vector<FrameBreakdown> frame_breakdown;
};

void to_json(json& j, const FrameBreakdown& frame);
void to_json(json& j, const AnalysisDetails& details);

#endif // ANALYSIS_DETAILS_HPP
