#ifndef BOOST_STAGES_HPP
#define BOOST_STAGES_HPP

#include "analysis_details.hpp"
#include "detection_config.hpp"
#include "media_types.hpp"
#include "probes/probe.hpp"
#include "video_consistency.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Classifier output for one frame, stripped of its pixels
struct ScoredFrame {
    std::string name;
    FrameKind kind = FrameKind::FULL;
    float weight = 0.0f;
    int face_index = -1;
    int video_frame = -1;
    FrameScore score;
};

// Read-only inputs shared by every stage of one aggregation
struct AggregationContext {
    MediaType media_type = MediaType::IMAGE;
    int faces_detected = 0;
    std::vector<ScoredFrame> frames;
    std::map<std::string, probes::ProbeResult> probe_results;
    std::optional<VideoConsistencyReport> video_consistency;

    // Score of a probe, 0 when it did not run
    float probeScore(const std::string& name) const;
    // Boolean detail of a probe, false when absent
    bool probeFlag(const std::string& name, const std::string& key) const;
    const json* probeDetails(const std::string& name) const;
};

// Running score and the details gathered so far
struct ScoreState {
    double fake = 0.0;
    AnalysisDetails details;
};

// One ordered step of the score pipeline. Stages never mutate their input.
class BoostStage {
public:
    explicit BoostStage(const DetectionConfig& config) : config_(config) {}
    virtual ~BoostStage() = default;

    virtual std::string name() const = 0;
    virtual ScoreState apply(const ScoreState& state, const AggregationContext& context) const = 0;

protected:
    DetectionConfig config_;
};

// Fake score of every classified frame, in classification order
std::vector<double> frameFakeScores(const std::vector<ScoredFrame>& frames);

// (variance * 2.5 + mean |diff| * 1.5) / 2, capped
double temporalInconsistency(const std::vector<double>& scores, const DetectionConfig& config);

class TemporalStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "temporal"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;

private:
    static constexpr size_t MIN_FRAMES = 3;
};

class VideoConsistencyStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "video_consistency"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

class FrequencyBoostStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "fft_boost"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

class EyeBoostStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "eye_boost"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// High variance across per-face scores marks selective manipulation of one face
class MultiFaceStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "multi_face"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// Lowers the score of heavily filtered selfies
class FilterCompensationStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "filter_compensation"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

class GanFingerprintStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "gan_fingerprint"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// Faceless monitor/UI footage. Must run before the no-face branch.
class ScreenCompensationStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "screen_compensation"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// Zero faces: trust a high frame average, force a low one to the authentic value,
// and let mixed signals through with the scene analysis boost
class NoFaceStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "no_face"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;

    static constexpr const char* BRANCH_TRUSTED = "trusted_frame_average";
    static constexpr const char* BRANCH_AUTHENTIC = "forced_authentic";
    static constexpr const char* BRANCH_MIXED = "mixed_signals";
};

class StylizationStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "stylization"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// Compression, EXIF and blending forensics. Boosts add up independently.
class ForensicBoostStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "phase1_forensics"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// Landmark, texture and probe-ensemble disagreement
class EnsembleBoostStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "phase2_ensemble"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;

    static const std::vector<std::string>& secondaryProbes();
};

class FinalClampStage : public BoostStage {
public:
    using BoostStage::BoostStage;
    std::string name() const override { return "final_clamp"; }
    ScoreState apply(const ScoreState& state, const AggregationContext& context) const override;
};

// The stages in the order they must run
std::vector<std::unique_ptr<BoostStage>> makeDefaultStages(const DetectionConfig& config);

#endif // BOOST_STAGES_HPP
