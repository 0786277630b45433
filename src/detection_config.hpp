#ifndef DETECTION_CONFIG_HPP
#define DETECTION_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

using json = nlohmann::json;

struct DetectorParams {
    double scale_factor;
    int min_neighbors;
};

// Every tunable threshold, weight and boost constant used by the pipeline.
struct DetectionConfig {
    // Classification tiers
    double fake_threshold = 0.52;
    double suspicious_threshold = 0.42;

    // Face locator
    int min_face_size = 40;
    double face_confidence_threshold = 0.6;
    int detection_max_width = 960;
    std::vector<DetectorParams> detector_params = {{1.1, 5}, {1.05, 3}, {1.2, 6}};
    std::vector<std::string> cascade_names = {
        "haarcascade_frontalface_default.xml",
        "haarcascade_frontalface_alt2.xml",
        "haarcascade_frontalface_alt.xml"
    };

    // Region extraction
    int optimal_size = 384;
    double face_margin = 0.30;
    bool enhance_face_crops = true;
    std::vector<double> multi_scale_sizes = {1.0, 0.7};
    int min_scaled_size = 128;

    // Video sampling
    int video_frame_count = 5;

    // Temporal inconsistency
    double temporal_variance_weight = 2.5;
    double temporal_diff_weight = 1.5;
    double temporal_cap = 0.35;
    double temporal_min = 0.05;

    // Video consistency
    double video_consistency_threshold = 0.6;
    double video_consistency_scale = 0.2;

    // Channel boosts
    double fft_boost_trigger = 0.6;
    double fft_boost_scale = 0.2;
    double eye_boost_trigger = 0.65;
    double eye_boost_scale = 0.15;

    // Multi-face consistency
    double multi_face_variance_threshold = 0.05;
    double multi_face_variance_scale = 0.5;
    double multi_face_boost_cap = 0.12;

    // Social media filter
    double has_filter_threshold = 0.4;
    double filter_compensation_threshold = 0.5;
    double filter_compensation_scale = 0.06;
    double filter_floor = 0.08;

    double gan_fingerprint_boost = 0.08;

    // Screen content
    double screen_detection_threshold = 0.5;
    double screen_compensation_scale = 0.4;
    double screen_floor = 0.05;

    // No-face branch
    double noface_trust_threshold = 0.5;
    double noface_low_threshold = 0.3;
    double noface_authentic_score = 0.08;
    double noface_ai_boost_scale = 0.3;
    double noface_suspicious_boost_scale = 0.15;

    // Phase 1 forensics
    double double_compression_boost = 0.08;
    double editing_software_boost = 0.10;
    double metadata_stripped_boost = 0.05;
    double blending_boost = 0.15;

    // Phase 2
    double landmark_boost = 0.06;
    double smooth_texture_boost = 0.05;
    double ensemble_disagreement_threshold = 0.2;
    double ensemble_scale = 0.25;

    // Final clamp
    double max_fake = 0.99;
    double min_fake = 0.01;

    // Probe switches, keyed by probe name. Missing entries are enabled.
    std::map<std::string, bool> probes;

    bool isProbeEnabled(const std::string& name) const;

    // Loads a JSON file over the defaults. Throws FakescanError on unreadable or malformed files.
    static DetectionConfig loadFromFile(const std::string& path);
};

void to_json(json& j, const DetectorParams& p);
void from_json(const json& j, DetectorParams& p);
void to_json(json& j, const DetectionConfig& c);
void from_json(const json& j, DetectionConfig& c);

#endif // DETECTION_CONFIG_HPP
