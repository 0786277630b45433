#include "score_aggregator.hpp"
#include "probes/image_stats.hpp"
#include <iomanip>
#include <iostream>
#include <map>

namespace {

std::optional<double> channelMean(const std::vector<double>& scores) {
    if (scores.empty()) {
        return std::nullopt;
    }
    return probes::mean(scores);
}

}

ScoreAggregator::ScoreAggregator(const DetectionConfig& config)
    : ScoreAggregator(config, makeDefaultStages(config)) {
}

ScoreAggregator::ScoreAggregator(const DetectionConfig& config, std::vector<std::unique_ptr<BoostStage>> stages)
    : config_(config), stages_(std::move(stages)), fallback_clamp_(config) {
}

std::string ScoreAggregator::contentType(int faces_detected) {
    if (faces_detected == 0) {
        return "scene";
    }
    return faces_detected == 1 ? "portrait" : "group";
}

ScoreState ScoreAggregator::weightedVote(const AggregationContext& context) const {
    ScoreState state;
    AnalysisDetails& details = state.details;
    details.media_type = mediaTypeToString(context.media_type);
    details.content_type = contentType(context.faces_detected);
    details.faces_detected = context.faces_detected;
    details.total_frames = static_cast<int>(context.frames.size());

    for (const auto& entry : context.probe_results) {
        details.probe_analyses[entry.first] = entry.second.details;
        details.probe_analyses[entry.first]["score"] = entry.second.score;
    }

    double weighted_fake = 0.0;
    double weighted_real = 0.0;
    double total_weight = 0.0;
    std::vector<double> face_channel;
    std::vector<double> fft_channel;
    std::vector<double> eye_channel;
    std::map<int, std::vector<double>> per_face;

    for (const ScoredFrame& frame : context.frames) {
        weighted_fake += static_cast<double>(frame.score.fake) * frame.weight;
        weighted_real += static_cast<double>(frame.score.real) * frame.weight;
        total_weight += frame.weight;

        bool fake_vote = frame.score.fake > 0.5f;
        if (fake_vote) {
            ++details.fake_votes;
        }

        if (isFaceAppearanceFrame(frame.kind)) {
            face_channel.push_back(frame.score.fake);
            if (frame.face_index >= 0) {
                per_face[frame.face_index].push_back(frame.score.fake);
            }
        }
        if (isFrequencyFrame(frame.kind)) {
            fft_channel.push_back(frame.score.fake);
        }
        if (isEyeFrame(frame.kind)) {
            eye_channel.push_back(frame.score.fake);
        }

        FrameBreakdown breakdown;
        breakdown.name = frame.name;
        breakdown.type = frameKindToString(frame.kind);
        breakdown.weight = frame.weight;
        breakdown.fake = frame.score.fake;
        breakdown.real = frame.score.real;
        breakdown.fake_vote = fake_vote;
        breakdown.face_index = frame.face_index;
        breakdown.video_frame = frame.video_frame;
        details.frame_breakdown.push_back(breakdown);
    }

    details.real_votes = details.total_frames - details.fake_votes;
    details.vote_ratio = details.total_frames > 0
        ? static_cast<double>(details.fake_votes) / details.total_frames : 0.0;
    details.total_weight = total_weight;

    for (const auto& entry : per_face) {
        details.face_scores.push_back(probes::mean(entry.second));
    }
    details.avg_face_score = channelMean(face_channel);
    details.avg_fft_score = channelMean(fft_channel);
    details.avg_eye_score = channelMean(eye_channel);

    if (context.frames.empty() || total_weight <= 0.0) {
        details.aggregation_fallback = true;
        details.weighted_fake = 0.5;
        details.weighted_real = 0.5;
        state.fake = 0.5;
        return state;
    }

    details.weighted_fake = weighted_fake / total_weight;
    details.weighted_real = weighted_real / total_weight;
    state.fake = details.weighted_fake;
    return state;
}

AggregationResult ScoreAggregator::aggregate(const AggregationContext& context) const {
    ScoreState state = weightedVote(context);
    std::cout << "Score aggregator: weighted vote " << std::fixed << std::setprecision(4) << state.fake
              << " over " << state.details.total_frames << " frames ("
              << state.details.fake_votes << " fake votes)" << std::endl;

    if (state.details.aggregation_fallback) {
        std::cerr << "Score aggregator: no usable frame weight, falling back to 0.5/0.5" << std::endl;
        state = fallback_clamp_.apply(state, context);
    } else {
        for (const auto& stage : stages_) {
            double before = state.fake;
            state = stage->apply(state, context);
            if (state.fake != before) {
                std::cout << "Score aggregator: " << stage->name() << " " << before
                          << " -> " << state.fake << std::endl;
            }
        }
    }

    AggregationResult result;
    result.scores.fake = state.fake;
    result.scores.real = 1.0 - state.fake;
    result.details = std::move(state.details);
    return result;
}
