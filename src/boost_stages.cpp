#include "boost_stages.hpp"
#include "probes/image_stats.hpp"
#include <algorithm>
#include <cmath>

float AggregationContext::probeScore(const std::string& name) const {
    auto it = probe_results.find(name);
    return it == probe_results.end() ? 0.0f : it->second.score;
}

const json* AggregationContext::probeDetails(const std::string& name) const {
    auto it = probe_results.find(name);
    return it == probe_results.end() ? nullptr : &it->second.details;
}

bool AggregationContext::probeFlag(const std::string& name, const std::string& key) const {
    const json* details = probeDetails(name);
    if (details == nullptr || !details->is_object()) {
        return false;
    }
    auto it = details->find(key);
    return it != details->end() && it->is_boolean() && it->get<bool>();
}

std::vector<double> frameFakeScores(const std::vector<ScoredFrame>& frames) {
    std::vector<double> scores;
    scores.reserve(frames.size());
    for (const ScoredFrame& frame : frames) {
        scores.push_back(frame.score.fake);
    }
    return scores;
}

double temporalInconsistency(const std::vector<double>& scores, const DetectionConfig& config) {
    if (scores.size() < 2) {
        return 0.0;
    }
    double variance = probes::populationVariance(scores);
    std::vector<double> diffs;
    for (size_t i = 1; i < scores.size(); ++i) {
        diffs.push_back(std::abs(scores[i] - scores[i - 1]));
    }
    double mean_diff = probes::mean(diffs);
    double inconsistency = (variance * config.temporal_variance_weight + mean_diff * config.temporal_diff_weight) / 2.0;
    return std::min(inconsistency, config.temporal_cap);
}

ScoreState TemporalStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.media_type != MediaType::VIDEO) {
        return next;
    }

    std::vector<double> scores = frameFakeScores(context.frames);
    if (scores.size() < MIN_FRAMES) {
        return next;
    }

    double boost = temporalInconsistency(scores, config_);
    next.details.temporal_variance = probes::populationVariance(scores);
    next.details.temporal_boost = boost;
    if (boost > config_.temporal_min) {
        next.fake += boost;
    }
    return next;
}

ScoreState VideoConsistencyStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.media_type != MediaType::VIDEO || !context.video_consistency) {
        return next;
    }

    const VideoConsistencyReport& report = *context.video_consistency;
    next.details.video_consistency = json(report);
    if (report.overall < config_.video_consistency_threshold) {
        double boost = (config_.video_consistency_threshold - report.overall) * config_.video_consistency_scale;
        next.details.video_consistency_boost = boost;
        next.fake += boost;
    }
    return next;
}

ScoreState FrequencyBoostStage::apply(const ScoreState& state, const AggregationContext&) const {
    ScoreState next = state;
    if (state.details.avg_fft_score && *state.details.avg_fft_score > config_.fft_boost_trigger) {
        double boost = (*state.details.avg_fft_score - 0.5) * config_.fft_boost_scale;
        next.details.fft_boost = boost;
        next.fake += boost;
    }
    return next;
}

ScoreState EyeBoostStage::apply(const ScoreState& state, const AggregationContext&) const {
    ScoreState next = state;
    if (state.details.avg_eye_score && *state.details.avg_eye_score > config_.eye_boost_trigger) {
        double boost = (*state.details.avg_eye_score - 0.5) * config_.eye_boost_scale;
        next.details.eye_boost = boost;
        next.fake += boost;
    }
    return next;
}

ScoreState MultiFaceStage::apply(const ScoreState& state, const AggregationContext&) const {
    ScoreState next = state;
    const std::vector<double>& face_scores = state.details.face_scores;
    if (face_scores.size() <= 1) {
        return next;
    }

    double variance = probes::populationVariance(face_scores);
    next.details.multi_face_variance = variance;
    if (variance > config_.multi_face_variance_threshold) {
        double boost = std::min(config_.multi_face_boost_cap, variance * config_.multi_face_variance_scale);
        next.details.multi_face_boost = boost;
        next.fake += boost;
    }
    return next;
}

ScoreState FilterCompensationStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    double intensity = context.probeScore("filter");
    next.details.filter_intensity = intensity;
    next.details.has_filter = intensity >= config_.has_filter_threshold;

    if (intensity > config_.filter_compensation_threshold) {
        double compensated = std::max(config_.filter_floor, state.fake - config_.filter_compensation_scale * intensity);
        compensated = std::min(compensated, state.fake);
        next.details.filter_compensation = state.fake - compensated;
        next.fake = compensated;
    }
    return next;
}

ScoreState GanFingerprintStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    bool detected = std::any_of(context.frames.begin(), context.frames.end(), [this](const ScoredFrame& frame) {
        return isFrequencyFrame(frame.kind) && frame.score.fake > config_.fake_threshold;
    });
    if (detected) {
        next.details.gan_fingerprint_boost = config_.gan_fingerprint_boost;
        next.fake += config_.gan_fingerprint_boost;
    }
    return next;
}

ScoreState ScreenCompensationStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    double confidence = context.probeScore("screen");
    next.details.screen_confidence = confidence;
    next.details.is_screen_content = confidence >= config_.screen_detection_threshold;

    if (context.faces_detected == 0 && next.details.is_screen_content) {
        double compensated = std::max(config_.screen_floor, state.fake - config_.screen_compensation_scale * confidence);
        compensated = std::min(compensated, state.fake);
        next.details.screen_compensation = state.fake - compensated;
        next.fake = compensated;
    }
    return next;
}

ScoreState NoFaceStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.faces_detected != 0 || state.details.is_screen_content) {
        return next;
    }

    if (state.details.weighted_fake > config_.noface_trust_threshold) {
        next.details.noface_branch = BRANCH_TRUSTED;
        return next;
    }

    double face = state.details.avg_face_score.value_or(0.0);
    double fft = state.details.avg_fft_score.value_or(0.0);
    double eye = state.details.avg_eye_score.value_or(0.0);
    if (face < config_.noface_low_threshold && fft < config_.noface_low_threshold && eye < config_.noface_low_threshold) {
        next.details.noface_branch = BRANCH_AUTHENTIC;
        next.fake = config_.noface_authentic_score;
        return next;
    }

    next.details.noface_branch = BRANCH_MIXED;
    const json* scene = context.probeDetails("scene");
    if (scene != nullptr && scene->contains("classification") && (*scene)["classification"].is_string()) {
        std::string classification = (*scene)["classification"].get<std::string>();
        double combined = context.probeScore("scene");
        next.details.scene_classification = classification;

        double boost = 0.0;
        if (classification == "likely_ai_generated") {
            boost = config_.noface_ai_boost_scale * combined;
        } else if (classification == "suspicious") {
            boost = config_.noface_suspicious_boost_scale * combined;
        }
        if (boost > 0.0) {
            next.details.scene_boost = boost;
            next.fake += boost;
        }
    }
    return next;
}

ScoreState StylizationStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.media_type != MediaType::IMAGE || !context.probeFlag("stylization", "is_stylized")) {
        return next;
    }

    const json* details = context.probeDetails("stylization");
    double boost = details->value("fake_boost", 0.0);
    next.details.is_stylized = true;
    next.details.style_type = details->value("style_type", std::string("unknown"));
    if (boost > 0.0) {
        next.details.stylization_boost = boost;
        next.fake += boost;
    }
    return next;
}

ScoreState ForensicBoostStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.media_type != MediaType::IMAGE) {
        return next;
    }

    double total = 0.0;
    if (context.probeFlag("compression", "double_compression_detected")) {
        next.details.double_compression_boost = config_.double_compression_boost;
        total += config_.double_compression_boost;
    }
    if (context.probeFlag("exif", "editing_software_detected")) {
        next.details.editing_software_boost = config_.editing_software_boost;
        total += config_.editing_software_boost;
    }
    if (context.probeFlag("exif", "metadata_stripped")) {
        next.details.metadata_stripped_boost = config_.metadata_stripped_boost;
        total += config_.metadata_stripped_boost;
    }
    if (context.probeFlag("blending", "blending_detected")) {
        next.details.blending_boost = config_.blending_boost;
        total += config_.blending_boost;
    }

    next.details.phase1_boost = total;
    next.fake += total;
    return next;
}

const std::vector<std::string>& EnsembleBoostStage::secondaryProbes() {
    static const std::vector<std::string> names = {
        "frequency", "color", "noise", "compression", "blending", "landmark"
    };
    return names;
}

ScoreState EnsembleBoostStage::apply(const ScoreState& state, const AggregationContext& context) const {
    ScoreState next = state;
    if (context.media_type != MediaType::IMAGE) {
        return next;
    }

    double total = 0.0;
    if (context.probeFlag("landmark", "landmark_suspicious")) {
        next.details.landmark_boost = config_.landmark_boost;
        total += config_.landmark_boost;
    }
    if (context.probeFlag("landmark", "too_smooth")) {
        next.details.smooth_texture_boost = config_.smooth_texture_boost;
        total += config_.smooth_texture_boost;
    }

    // Disabled or failed probes count as zero suspicion
    std::vector<double> scores;
    for (const std::string& probe : secondaryProbes()) {
        scores.push_back(context.probeScore(probe));
    }
    double disagreement = probes::mean(scores) - state.fake;
    next.details.ensemble_disagreement = disagreement;
    if (disagreement > config_.ensemble_disagreement_threshold) {
        double boost = disagreement * config_.ensemble_scale;
        next.details.ensemble_boost = boost;
        total += boost;
    }

    next.details.phase2_boost = total;
    next.fake += total;
    return next;
}

ScoreState FinalClampStage::apply(const ScoreState& state, const AggregationContext&) const {
    ScoreState next = state;
    double fake = state.fake;
    if (!std::isfinite(fake)) {
        fake = 0.5;
        next.details.aggregation_fallback = true;
    }
    next.details.pre_clamp_fake = fake;
    next.fake = std::max(config_.min_fake, std::min(config_.max_fake, fake));
    return next;
}

std::vector<std::unique_ptr<BoostStage>> makeDefaultStages(const DetectionConfig& config) {
    std::vector<std::unique_ptr<BoostStage>> stages;
    stages.push_back(std::make_unique<TemporalStage>(config));
    stages.push_back(std::make_unique<VideoConsistencyStage>(config));
    stages.push_back(std::make_unique<FrequencyBoostStage>(config));
    stages.push_back(std::make_unique<EyeBoostStage>(config));
    stages.push_back(std::make_unique<MultiFaceStage>(config));
    stages.push_back(std::make_unique<FilterCompensationStage>(config));
    stages.push_back(std::make_unique<GanFingerprintStage>(config));
    stages.push_back(std::make_unique<ScreenCompensationStage>(config));
    stages.push_back(std::make_unique<NoFaceStage>(config));
    stages.push_back(std::make_unique<StylizationStage>(config));
    stages.push_back(std::make_unique<ForensicBoostStage>(config));
    stages.push_back(std::make_unique<EnsembleBoostStage>(config));
    stages.push_back(std::make_unique<FinalClampStage>(config));
    return stages;
}
