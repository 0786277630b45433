#include "detection_config.hpp"
#include "fakescan_errors.hpp"
#include <fstream>
#include <iostream>

namespace {

// Single field list shared by serialization and loading
template <typename Config, typename Visitor>
void forEachField(Config& c, Visitor&& visit) {
    visit("fake_threshold", c.fake_threshold);
    visit("suspicious_threshold", c.suspicious_threshold);
    visit("min_face_size", c.min_face_size);
    visit("face_confidence_threshold", c.face_confidence_threshold);
    visit("detection_max_width", c.detection_max_width);
    visit("detector_params", c.detector_params);
    visit("cascade_names", c.cascade_names);
    visit("optimal_size", c.optimal_size);
    visit("face_margin", c.face_margin);
    visit("enhance_face_crops", c.enhance_face_crops);
    visit("multi_scale_sizes", c.multi_scale_sizes);
    visit("min_scaled_size", c.min_scaled_size);
    visit("video_frame_count", c.video_frame_count);
    visit("temporal_variance_weight", c.temporal_variance_weight);
    visit("temporal_diff_weight", c.temporal_diff_weight);
    visit("temporal_cap", c.temporal_cap);
    visit("temporal_min", c.temporal_min);
    visit("video_consistency_threshold", c.video_consistency_threshold);
    visit("video_consistency_scale", c.video_consistency_scale);
    visit("fft_boost_trigger", c.fft_boost_trigger);
    visit("fft_boost_scale", c.fft_boost_scale);
    visit("eye_boost_trigger", c.eye_boost_trigger);
    visit("eye_boost_scale", c.eye_boost_scale);
    visit("multi_face_variance_threshold", c.multi_face_variance_threshold);
    visit("multi_face_variance_scale", c.multi_face_variance_scale);
    visit("multi_face_boost_cap", c.multi_face_boost_cap);
    visit("has_filter_threshold", c.has_filter_threshold);
    visit("filter_compensation_threshold", c.filter_compensation_threshold);
    visit("filter_compensation_scale", c.filter_compensation_scale);
    visit("filter_floor", c.filter_floor);
    visit("gan_fingerprint_boost", c.gan_fingerprint_boost);
    visit("screen_detection_threshold", c.screen_detection_threshold);
    visit("screen_compensation_scale", c.screen_compensation_scale);
    visit("screen_floor", c.screen_floor);
    visit("noface_trust_threshold", c.noface_trust_threshold);
    visit("noface_low_threshold", c.noface_low_threshold);
    visit("noface_authentic_score", c.noface_authentic_score);
    visit("noface_ai_boost_scale", c.noface_ai_boost_scale);
    visit("noface_suspicious_boost_scale", c.noface_suspicious_boost_scale);
    visit("double_compression_boost", c.double_compression_boost);
    visit("editing_software_boost", c.editing_software_boost);
    visit("metadata_stripped_boost", c.metadata_stripped_boost);
    visit("blending_boost", c.blending_boost);
    visit("landmark_boost", c.landmark_boost);
    visit("smooth_texture_boost", c.smooth_texture_boost);
    visit("ensemble_disagreement_threshold", c.ensemble_disagreement_threshold);
    visit("ensemble_scale", c.ensemble_scale);
    visit("max_fake", c.max_fake);
    visit("min_fake", c.min_fake);
    visit("probes", c.probes);
}

} // namespace

bool DetectionConfig::isProbeEnabled(const std::string& name) const {
    auto it = probes.find(name);
    return it == probes.end() || it->second;
}

DetectionConfig DetectionConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw FakescanError("Cannot open config file: " + path);
    }

    try {
        json data = json::parse(file);
        DetectionConfig config = data.get<DetectionConfig>();
        if (config.suspicious_threshold > config.fake_threshold) {
            throw FakescanError("suspicious_threshold must not exceed fake_threshold");
        }
        std::cout << "Loaded detection config from " << path << std::endl;
        return config;
    } catch (const json::exception& e) {
        throw FakescanError("Invalid config file " + path + ": " + e.what());
    }
}

void to_json(json& j, const DetectorParams& p) {
    j = json{{"scale_factor", p.scale_factor}, {"min_neighbors", p.min_neighbors}};
}

void from_json(const json& j, DetectorParams& p) {
    j.at("scale_factor").get_to(p.scale_factor);
    j.at("min_neighbors").get_to(p.min_neighbors);
}

void to_json(json& j, const DetectionConfig& c) {
    j = json::object();
    forEachField(c, [&j](const char* key, const auto& value) {
        j[key] = value;
    });
}

void from_json(const json& j, DetectionConfig& c) {
    forEachField(c, [&j](const char* key, auto& value) {
        if (j.contains(key)) {
            j.at(key).get_to(value);
        }
    });
}
