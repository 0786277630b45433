#include "analysis_details.hpp"

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}

void to_json(json& j, const FrameBreakdown& frame) {
    j = json{
        {"name", frame.name},
        {"type", frame.type},
        {"weight", frame.weight},
        {"fake", frame.fake},
        {"real", frame.real},
        {"vote", frame.fake_vote ? "fake" : "real"}
    };
    if (frame.face_index >= 0) {
        j["face_index"] = frame.face_index;
    }
    if (frame.video_frame >= 0) {
        j["video_frame"] = frame.video_frame;
    }
}

void to_json(json& j, const AnalysisDetails& d) {
    j = json{
        {"media_type", d.media_type},
        {"content_type", d.content_type},
        {"total_frames", d.total_frames},
        {"fake_votes", d.fake_votes},
        {"real_votes", d.real_votes},
        {"vote_ratio", d.vote_ratio},
        {"total_weight", d.total_weight},
        {"weighted_fake", d.weighted_fake},
        {"weighted_real", d.weighted_real},
        {"aggregation_fallback", d.aggregation_fallback},
        {"faces_detected", d.faces_detected},
        {"face_scores", d.face_scores},
        {"avg_face_score", nullable(d.avg_face_score)},
        {"avg_fft_score", nullable(d.avg_fft_score)},
        {"avg_eye_score", nullable(d.avg_eye_score)},
        {"probe_analyses", d.probe_analyses},
        {"has_filter", d.has_filter},
        {"filter_intensity", d.filter_intensity},
        {"is_screen_content", d.is_screen_content},
        {"screen_confidence", d.screen_confidence},
        {"is_stylized", d.is_stylized},
        {"style_type", nullable(d.style_type)},
        {"temporal_boost", nullable(d.temporal_boost)},
        {"temporal_variance", nullable(d.temporal_variance)},
        {"video_consistency_boost", nullable(d.video_consistency_boost)},
        {"video_consistency", nullable(d.video_consistency)},
        {"fft_boost", nullable(d.fft_boost)},
        {"eye_boost", nullable(d.eye_boost)},
        {"multi_face_variance", nullable(d.multi_face_variance)},
        {"multi_face_boost", nullable(d.multi_face_boost)},
        {"filter_compensation", nullable(d.filter_compensation)},
        {"gan_fingerprint_boost", nullable(d.gan_fingerprint_boost)},
        {"screen_compensation", nullable(d.screen_compensation)},
        {"noface_branch", nullable(d.noface_branch)},
        {"scene_classification", nullable(d.scene_classification)},
        {"scene_boost", nullable(d.scene_boost)},
        {"stylization_boost", nullable(d.stylization_boost)},
        {"double_compression_boost", nullable(d.double_compression_boost)},
        {"editing_software_boost", nullable(d.editing_software_boost)},
        {"metadata_stripped_boost", nullable(d.metadata_stripped_boost)},
        {"blending_boost", nullable(d.blending_boost)},
        {"phase1_boost", nullable(d.phase1_boost)},
        {"landmark_boost", nullable(d.landmark_boost)},
        {"smooth_texture_boost", nullable(d.smooth_texture_boost)},
        {"ensemble_disagreement", nullable(d.ensemble_disagreement)},
        {"ensemble_boost", nullable(d.ensemble_boost)},
        {"phase2_boost", nullable(d.phase2_boost)},
        {"pre_clamp_fake", d.pre_clamp_fake},
        {"frame_breakdown", d.frame_breakdown}
    };
}
