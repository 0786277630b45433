#include "src/score_aggregator.hpp"
#include "src/classification_finalizer.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool condition, const std::string& label) {
    std::cout << (condition ? "✓ " : "✗ ") << label << std::endl;
    if (!condition) {
        failures++;
    }
}

static bool near(double actual, double expected, double tolerance = 1e-6) {
    return std::abs(actual - expected) <= tolerance;
}

static ScoredFrame frame(const std::string& name, FrameKind kind, float weight, float fake,
                         int face_index = -1, int video_frame = -1) {
    ScoredFrame f;
    f.name = name;
    f.kind = kind;
    f.weight = weight;
    f.face_index = face_index;
    f.video_frame = video_frame;
    f.score.fake = fake;
    f.score.real = 1.0f - fake;
    return f;
}

static probes::ProbeResult probeResult(float score, const json& details = json::object()) {
    probes::ProbeResult result;
    result.score = score;
    result.details = details;
    return result;
}

static void testWeightedAverage(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Single face weighted vote --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    for (int i = 0; i < 3; i++) {
        context.frames.push_back(frame("face" + std::to_string(i), FrameKind::FACE, 5.0f, 0.8f, 0));
    }
    context.frames.push_back(frame("full", FrameKind::FULL, 1.0f, 0.1f));

    double expected = (3 * 5.0 * 0.8f + 1.0 * 0.1f) / 16.0;
    ScoreState vote = aggregator.weightedVote(context);
    check(near(vote.fake, expected), "weighted average is sum(fake * w) / sum(w)");
    check(vote.details.fake_votes == 3 && vote.details.real_votes == 1, "3 fake votes, 1 real vote");
    check(near(vote.details.vote_ratio, 0.75), "vote ratio 0.75");
    check(near(vote.details.total_weight, 16.0), "total weight 16");
    check(vote.details.content_type == "portrait", "one face is a portrait");
    check(vote.details.face_scores.size() == 1, "one per-face score");

    AggregationResult result = aggregator.aggregate(context);
    check(near(result.scores.fake, expected), "no boost fires on a clean single face");
    check(near(result.scores.fake + result.scores.real, 1.0, 1e-12), "fake + real == 1");
    check(result.details.phase1_boost && near(*result.details.phase1_boost, 0.0), "phase 1 total recorded as 0");
    check(!result.details.fft_boost && !result.details.eye_boost, "channel boosts stay null");
}

static void testFilterCompensation(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Filter compensation --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    context.frames.push_back(frame("face", FrameKind::FACE, 5.0f, 0.6f, 0));
    context.probe_results["filter"] = probeResult(0.9f);

    AggregationResult result = aggregator.aggregate(context);
    double reduction = 0.9 * 0.06;
    check(near(result.scores.fake, 0.6 - reduction), "score reduced by intensity * 0.06");
    check(result.details.filter_compensation && near(*result.details.filter_compensation, reduction),
          "reduction recorded in filter_compensation");
    check(result.details.has_filter, "has_filter set");

    AggregationContext low = context;
    low.frames = {frame("face", FrameKind::FACE, 5.0f, 0.1f, 0)};
    AggregationResult floored = aggregator.aggregate(low);
    check(near(floored.scores.fake, 0.08), "compensation stops at the 0.08 floor");
    check(floored.details.filter_compensation && near(*floored.details.filter_compensation, 0.02),
          "floored reduction is the actual drop");

    AggregationContext below = context;
    below.frames = {frame("face", FrameKind::FACE, 5.0f, 0.05f, 0)};
    AggregationResult untouched = aggregator.aggregate(below);
    check(near(untouched.scores.fake, 0.05), "score under the floor is never raised");

    AggregationContext mild = context;
    mild.probe_results["filter"] = probeResult(0.45f);
    AggregationResult mild_result = aggregator.aggregate(mild);
    check(mild_result.details.has_filter && !mild_result.details.filter_compensation,
          "intensity 0.45 flags the filter without compensating");
}

static void testForensicBoosts(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Phase 1 forensics --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    context.frames.push_back(frame("face", FrameKind::FACE, 5.0f, 0.3f, 0));
    context.probe_results["exif"] = probeResult(0.4f, {
        {"editing_software_detected", true},
        {"metadata_stripped", true}
    });

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.phase1_boost && near(*result.details.phase1_boost, 0.15), "both EXIF boosts add up to 0.15");
    check(near(result.scores.fake, 0.3 + 0.15), "phase 1 total added to the score");
    check(result.details.editing_software_boost && result.details.metadata_stripped_boost,
          "both boosts recorded");
    check(!result.details.blending_boost && !result.details.double_compression_boost, "unfired boosts stay null");

    AggregationContext video = context;
    video.media_type = MediaType::VIDEO;
    video.frames = {frame("f1_face1", FrameKind::FACE, 5.0f, 0.3f, 0, 0)};
    AggregationResult video_result = aggregator.aggregate(video);
    check(!video_result.details.phase1_boost, "phase 1 skipped on video");
}

static void testMultiFace(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Multi-face consistency --" << std::endl;

    AggregationContext context;
    context.faces_detected = 2;
    context.frames.push_back(frame("face1", FrameKind::FACE, 5.0f, 0.2f, 0));
    context.frames.push_back(frame("face2", FrameKind::FACE, 5.0f, 0.9f, 1));

    AggregationResult result = aggregator.aggregate(context);
    double variance = 0.1225;
    double boost = std::min(0.12, variance * 0.5);
    check(result.details.content_type == "group", "two faces are a group");
    check(result.details.multi_face_variance && near(*result.details.multi_face_variance, variance),
          "population variance of per-face scores");
    check(result.details.multi_face_boost && near(*result.details.multi_face_boost, boost),
          "boost is min(0.12, variance * 0.5)");
    check(near(result.scores.fake, 0.55 + boost), "boost added once");
}

static void testTemporal(const ScoreAggregator& aggregator, const DetectionConfig& config) {
    std::cout << "\n-- Temporal inconsistency --" << std::endl;

    AggregationContext context;
    context.media_type = MediaType::VIDEO;
    context.faces_detected = 1;
    std::vector<float> scores = {0.2f, 0.8f, 0.2f};
    for (int j = 0; j < 3; j++) {
        context.frames.push_back(frame("f" + std::to_string(j + 1) + "_face1", FrameKind::FACE, 5.0f, scores[j], 0, j));
    }

    check(near(temporalInconsistency({0.2, 0.8, 0.2}, config), 0.35), "inconsistency capped at 0.35");
    check(near(temporalInconsistency({0.5, 0.5, 0.5}, config), 0.0), "steady scores give no inconsistency");

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.temporal_boost && near(*result.details.temporal_boost, 0.35), "temporal boost recorded");
    check(near(result.scores.fake, 0.4 + 0.35, 1e-5), "temporal boost added");

    AggregationContext short_video = context;
    short_video.frames.pop_back();
    AggregationResult short_result = aggregator.aggregate(short_video);
    check(!short_result.details.temporal_boost, "two classified frames never evaluate the temporal boost");

    // Two samples still classify five frames: face, fft and eyes, then face and eyes
    AggregationContext two_samples;
    two_samples.media_type = MediaType::VIDEO;
    two_samples.faces_detected = 1;
    two_samples.frames.push_back(frame("f1_face1", FrameKind::FACE, 3.5f, 0.3f, 0, 0));
    two_samples.frames.push_back(frame("f1_face1_fft", FrameKind::FACE_FFT, 2.1f, 0.5f, 0, 0));
    two_samples.frames.push_back(frame("f1_face1_eyes", FrameKind::EYES, 2.8f, 0.3f, 0, 0));
    two_samples.frames.push_back(frame("f2_face1", FrameKind::FACE, 3.5f, 0.3f, 0, 1));
    two_samples.frames.push_back(frame("f2_face1_eyes", FrameKind::EYES, 2.8f, 0.4f, 0, 1));

    std::vector<double> in_order = frameFakeScores(two_samples.frames);
    check(in_order.size() == 5 && near(in_order[1], 0.5) && near(in_order[4], 0.4),
          "frame scores kept in classification order");

    AggregationResult two_result = aggregator.aggregate(two_samples);
    check(two_result.details.temporal_boost.has_value(), "two samples with five frames evaluate the temporal boost");
    check(two_result.details.temporal_boost && near(*two_result.details.temporal_boost, 0.10175),
          "boost uses every frame score, not per-sample means");
    check(two_result.details.temporal_variance && near(*two_result.details.temporal_variance, 0.0064),
          "variance over the five frame scores");
    check(near(two_result.scores.fake, 5.11 / 14.7 + 0.10175, 1e-5), "frame-level boost added to the weighted vote");

    AggregationContext image = context;
    image.media_type = MediaType::IMAGE;
    check(!aggregator.aggregate(image).details.temporal_boost, "temporal boost is video only");
}

static void testVideoConsistency(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Video consistency --" << std::endl;

    AggregationContext context;
    context.media_type = MediaType::VIDEO;
    context.faces_detected = 1;
    context.frames.push_back(frame("f1_face1", FrameKind::FACE, 5.0f, 0.3f, 0, 0));

    VideoConsistencyReport report;
    report.overall = 0.4;
    report.is_consistent = false;
    context.video_consistency = report;

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.video_consistency_boost && near(*result.details.video_consistency_boost, 0.04),
          "boost is (0.6 - overall) * 0.2");
    check(result.details.video_consistency.has_value(), "report attached to details");
}

static void testNoFaceBranches(const ScoreAggregator& aggregator) {
    std::cout << "\n-- No-face branches --" << std::endl;

    AggregationContext context;
    context.faces_detected = 0;
    context.frames.push_back(frame("full_image", FrameKind::FULL, 3.0f, 0.05f));
    context.frames.push_back(frame("full_fft", FrameKind::FULL_FFT, 1.5f, 0.05f));

    AggregationResult authentic = aggregator.aggregate(context);
    check(authentic.details.noface_branch && *authentic.details.noface_branch == NoFaceStage::BRANCH_AUTHENTIC,
          "low sub-scores take the authentic branch");
    check(near(authentic.scores.fake, 0.08), "score forced to 0.08");

    AggregationContext high = context;
    for (auto& f : high.frames) {
        f.score.fake = 0.9f;
        f.score.real = 0.1f;
    }
    AggregationResult trusted = aggregator.aggregate(high);
    check(trusted.details.noface_branch && *trusted.details.noface_branch == NoFaceStage::BRANCH_TRUSTED,
          "high average is trusted");
    check(trusted.scores.fake > 0.9 - 1e-6, "trusted score is not forced down");

    AggregationContext mixed = context;
    for (auto& f : mixed.frames) {
        f.score.fake = 0.4f;
        f.score.real = 0.6f;
    }
    mixed.probe_results["scene"] = probeResult(0.5f, {{"classification", "likely_ai_generated"}});
    AggregationResult mixed_result = aggregator.aggregate(mixed);
    check(mixed_result.details.noface_branch && *mixed_result.details.noface_branch == NoFaceStage::BRANCH_MIXED,
          "fft sub-score above 0.3 takes the mixed branch");
    check(mixed_result.details.scene_boost && near(*mixed_result.details.scene_boost, 0.15),
          "AI-generated scene adds 0.3 * combined");
    check(near(mixed_result.scores.fake, 0.55, 1e-5), "scene boost applied");
}

static void testScreenCompensation(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Screen compensation --" << std::endl;

    AggregationContext context;
    context.faces_detected = 0;
    context.frames.push_back(frame("full_image", FrameKind::FULL, 3.0f, 0.6f));
    context.probe_results["screen"] = probeResult(0.8f);

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.is_screen_content, "screen content detected");
    check(result.details.screen_compensation && near(*result.details.screen_compensation, 0.32, 1e-5),
          "reduction is 0.4 * confidence");
    check(near(result.scores.fake, 0.28, 1e-5), "score reduced");
    check(!result.details.noface_branch, "screen content skips the no-face branch");

    AggregationContext with_face = context;
    with_face.faces_detected = 1;
    with_face.frames = {frame("face", FrameKind::FACE, 5.0f, 0.6f, 0)};
    check(!aggregator.aggregate(with_face).details.screen_compensation, "faces disable screen compensation");
}

static void testEnsemble(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Ensemble disagreement --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    context.frames.push_back(frame("face", FrameKind::FACE, 5.0f, 0.2f, 0));
    for (const std::string& probe : EnsembleBoostStage::secondaryProbes()) {
        context.probe_results[probe] = probeResult(0.8f);
    }

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.ensemble_disagreement && near(*result.details.ensemble_disagreement, 0.6, 1e-5),
          "disagreement is probe mean minus score");
    check(result.details.ensemble_boost && near(*result.details.ensemble_boost, 0.15, 1e-5),
          "boost is disagreement * 0.25");
    check(near(result.scores.fake, 0.35, 1e-5), "ensemble boost applied");

    AggregationContext flagged;
    flagged.faces_detected = 1;
    flagged.frames = {frame("face", FrameKind::FACE, 5.0f, 0.3f, 0)};
    flagged.probe_results["landmark"] = probeResult(0.0f, {{"landmark_suspicious", true}, {"too_smooth", true}});
    AggregationResult flagged_result = aggregator.aggregate(flagged);
    check(flagged_result.details.phase2_boost && near(*flagged_result.details.phase2_boost, 0.11),
          "landmark and texture flags add 0.06 + 0.05");
}

static void testStylization(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Stylization --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    context.frames.push_back(frame("face1_s100", FrameKind::FACE, 5.0f, 0.3f, 0));
    context.probe_results["stylization"] = probeResult(0.6f, {
        {"is_stylized", true}, {"style_type", "anime"}, {"fake_boost", 0.4}
    });

    AggregationResult result = aggregator.aggregate(context);
    check(result.details.is_stylized, "stylized image marked");
    check(result.details.style_type && *result.details.style_type == "anime", "style type carried into details");
    check(result.details.stylization_boost && near(*result.details.stylization_boost, 0.4),
          "stylization boost recorded");
    check(near(result.scores.fake, 0.3 + 0.4, 1e-5), "stylization boost added");

    AggregationContext photo = context;
    photo.probe_results["stylization"] = probeResult(0.1f, {
        {"is_stylized", false}, {"style_type", "photorealistic"}, {"fake_boost", 0.0}
    });
    AggregationResult photo_result = aggregator.aggregate(photo);
    check(!photo_result.details.is_stylized && !photo_result.details.stylization_boost,
          "photorealistic image gets no stylization boost");

    AggregationContext video = context;
    video.media_type = MediaType::VIDEO;
    video.frames = {frame("f1_face1", FrameKind::FACE, 3.5f, 0.3f, 0, 0)};
    AggregationResult video_result = aggregator.aggregate(video);
    check(!video_result.details.is_stylized && !video_result.details.style_type, "stylization skipped for video");
    check(!video_result.details.stylization_boost, "no stylization boost for video");
    check(near(video_result.scores.fake, 0.3, 1e-5), "video score untouched by stylization");
}

static void testChannelBoosts(const DetectionConfig& config) {
    std::cout << "\n-- Channel boosts --" << std::endl;

    AggregationContext context;
    context.frames.push_back(frame("face_fft", FrameKind::FACE_FFT, 3.0f, 0.7f, 0));

    ScoreState state;
    state.fake = 0.4;
    state.details.avg_fft_score = 0.7;
    state.details.avg_eye_score = 0.75;

    ScoreState fft = FrequencyBoostStage(config).apply(state, context);
    check(fft.details.fft_boost && near(*fft.details.fft_boost, 0.04), "fft boost is (avg - 0.5) * 0.2");

    ScoreState eye = EyeBoostStage(config).apply(state, context);
    check(eye.details.eye_boost && near(*eye.details.eye_boost, 0.0375), "eye boost is (avg - 0.5) * 0.15");

    ScoreState gan = GanFingerprintStage(config).apply(state, context);
    check(near(gan.fake, 0.48), "frequency frame above the fake threshold adds 0.08");

    state.details.avg_fft_score = 0.55;
    check(!FrequencyBoostStage(config).apply(state, context).details.fft_boost, "fft boost needs avg above 0.6");
}

static void testClampAndFallback(const ScoreAggregator& aggregator, const DetectionConfig& config) {
    std::cout << "\n-- Clamp and fallback --" << std::endl;

    AggregationContext context;
    context.faces_detected = 1;
    context.frames.push_back(frame("face", FrameKind::FACE, 5.0f, 0.98f, 0));
    context.probe_results["exif"] = probeResult(0.4f, {{"editing_software_detected", true}});

    AggregationResult clamped = aggregator.aggregate(context);
    check(near(clamped.scores.fake, 0.99), "score clamped to 0.99");
    check(clamped.details.pre_clamp_fake > 0.99, "pre-clamp score kept");

    AggregationContext empty;
    AggregationResult fallback = aggregator.aggregate(empty);
    check(fallback.details.aggregation_fallback, "empty frame list falls back");
    check(near(fallback.scores.fake, 0.5) && near(fallback.scores.real, 0.5), "fallback pair is 0.5/0.5");
    check(!fallback.details.phase1_boost && !fallback.details.noface_branch, "boosts skipped on fallback");

    AggregationContext weightless;
    weightless.frames.push_back(frame("full", FrameKind::FULL, 0.0f, 0.9f));
    check(aggregator.aggregate(weightless).details.aggregation_fallback, "zero total weight falls back");

    ScoreState nan_state;
    nan_state.fake = std::numeric_limits<double>::quiet_NaN();
    ScoreState recovered = FinalClampStage(config).apply(nan_state, empty);
    check(near(recovered.fake, 0.5) && recovered.details.aggregation_fallback, "NaN becomes 0.5 at the clamp");
}

static void testStageOrder(const ScoreAggregator& aggregator) {
    std::cout << "\n-- Stage order --" << std::endl;

    std::vector<std::string> expected = {
        "temporal", "video_consistency", "fft_boost", "eye_boost", "multi_face",
        "filter_compensation", "gan_fingerprint", "screen_compensation", "no_face",
        "stylization", "phase1_forensics", "phase2_ensemble", "final_clamp"
    };
    std::vector<std::string> actual;
    for (const auto& stage : aggregator.stages()) {
        actual.push_back(stage->name());
    }
    check(actual == expected, "stages run in pipeline order");
}

static void testFinalizer(const DetectionConfig& config) {
    std::cout << "\n-- Finalizer --" << std::endl;

    ClassificationFinalizer finalizer(config);
    check(finalizer.classify(0.53) == Classification::FAKE, "0.53 is FAKE");
    check(finalizer.classify(0.52) == Classification::SUSPICIOUS, "0.52 is SUSPICIOUS");
    check(finalizer.classify(0.43) == Classification::SUSPICIOUS, "0.43 is SUSPICIOUS");
    check(finalizer.classify(0.42) == Classification::REAL, "0.42 is REAL");

    Verdict real = finalizer.finalize({0.2, 0.8});
    check(real.classification == Classification::REAL && near(real.confidence, 0.8), "REAL reports the real score");
    Verdict fake = finalizer.finalize({0.7, 0.3});
    check(fake.classification == Classification::FAKE && near(fake.confidence, 0.7), "FAKE reports the fake score");
    Verdict suspicious = finalizer.finalize({0.45, 0.55});
    check(suspicious.classification == Classification::SUSPICIOUS && near(suspicious.confidence, 0.45),
          "SUSPICIOUS reports the fake score");

    ClassificationFinalizer strict(0.8, 0.6);
    check(strict.classify(0.7) == Classification::SUSPICIOUS, "thresholds are tunable");
}

int main() {
    std::cout << "\n=== Score Aggregation Test ===\n" << std::endl;

    DetectionConfig config;
    ScoreAggregator aggregator(config);

    testWeightedAverage(aggregator);
    testFilterCompensation(aggregator);
    testForensicBoosts(aggregator);
    testMultiFace(aggregator);
    testTemporal(aggregator, config);
    testVideoConsistency(aggregator);
    testNoFaceBranches(aggregator);
    testScreenCompensation(aggregator);
    testEnsemble(aggregator);
    testStylization(aggregator);
    testChannelBoosts(config);
    testClampAndFallback(aggregator, config);
    testStageOrder(aggregator);
    testFinalizer(config);

    std::cout << "\n=== " << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failures) ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
