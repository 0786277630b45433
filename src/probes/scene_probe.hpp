#ifndef SCENE_PROBE_HPP
#define SCENE_PROBE_HPP

#include "probe.hpp"
#include "generator_signatures.hpp"

namespace probes {

enum class SceneVerdict {
    LIKELY_AUTHENTIC,
    SUSPICIOUS,
    LIKELY_AI_GENERATED
};

std::string sceneVerdictToString(SceneVerdict verdict);

struct GeneratorMatch {
    std::string generator = "likely_real";
    float confidence = 0.0f;
    bool likely_real = true;
};

struct BackgroundResult {
    float suspicion = 0.0f;
    bool suspicious = false;
    std::vector<std::string> artifacts;
    json details = json::object();
};

struct SceneConsistency {
    float consistency = 1.0f;
    bool consistent = true;
    std::vector<std::string> inconsistencies;
    json details = json::object();
};

// Scene, background and generator-signature analysis for images with no face.
// Score is the combined suspicion; details carry the three-tier verdict.
class SceneProbe : public Probe {
public:
    SceneProbe() : Probe("scene") {}

    // Best of the three family signatures and the generic traits
    static GeneratorMatch pickGenerator(float dalle, float midjourney, float stable_diffusion, float generic);

    static BackgroundResult analyzeBackground(const cv::Mat& gray);
    static SceneConsistency analyzeConsistency(const cv::Mat& image, const cv::Mat& gray);

    static float combine(const GeneratorMatch& match, float background, float consistency);
    static SceneVerdict classify(float combined);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr int MAX_ANALYSIS_SIDE = 768;
    static constexpr int GRID_SIZE = 8;
    static constexpr int CENTER_MARGIN = 20;
    static constexpr float LIKELY_REAL_BELOW = 0.25f;
    static constexpr float AI_GENERATED_ABOVE = 0.6f;
    static constexpr float SUSPICIOUS_ABOVE = 0.35f;
};

} // namespace probes

#endif // SCENE_PROBE_HPP
