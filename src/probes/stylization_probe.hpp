#ifndef STYLIZATION_PROBE_HPP
#define STYLIZATION_PROBE_HPP

#include "probe.hpp"

namespace probes {

enum class StyleType {
    PHOTOREALISTIC,
    RENDER_3D,
    CARTOON,
    ANIME,
    DIGITAL_ART,
    AVATAR,
    UNKNOWN
};

std::string styleTypeToString(StyleType type);

struct StyleComponents {
    float skin = 0.0f;
    float edge = 0.0f;
    float color = 0.0f;
    float outline = 0.0f;
    bool render_signature = false;
};

struct StyleDecision {
    bool is_stylized = false;
    StyleType style_type = StyleType::PHOTOREALISTIC;
    float combined = 0.0f;
    float fake_boost = 0.0f;
};

// Non-photorealistic content detection (3D renders, cartoons, digital art, avatars).
// Produces a positive fake-score boost for stylized content.
class StylizationProbe : public Probe {
public:
    StylizationProbe() : Probe("stylization") {}

    static StyleDecision decide(const StyleComponents& components);

    static float skinSmoothness(const cv::Mat& image, json& details);
    static float edgeSynthetic(const cv::Mat& gray, json& details);
    static float colorPalette(const cv::Mat& image, const cv::Mat& gray, json& details);
    static float cartoonOutlines(const cv::Mat& gray, json& details);
    static bool renderSignature(const cv::Mat& image, json& details);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr int ANALYSIS_SIZE = 384;
    static constexpr int PALETTE_SIZE = 128;
    static constexpr int PALETTE_CLUSTERS = 16;
    static constexpr double SKIN_WEIGHT = 0.35;
    static constexpr double EDGE_WEIGHT = 0.25;
    static constexpr double COLOR_WEIGHT = 0.25;
    static constexpr double OUTLINE_WEIGHT = 0.15;
    static constexpr double RENDER_SIGNATURE_BONUS = 0.15;
    static constexpr double STYLIZED_THRESHOLD = 0.65;
    static constexpr double UNCERTAIN_THRESHOLD = 0.45;
    static constexpr double MAX_BOOST = 0.4;
};

} // namespace probes

#endif // STYLIZATION_PROBE_HPP
