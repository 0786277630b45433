#ifndef BLENDING_PROBE_HPP
#define BLENDING_PROBE_HPP

#include "probe.hpp"

namespace probes {

// Composite seam check around the face boundary
class BlendingProbe : public Probe {
public:
    BlendingProbe() : Probe("blending") {}

    // Ring around the bbox, dilated proportionally to face width
    static cv::Mat boundaryMask(const cv::Size& image_size, const cv::Rect& bbox);

    static bool isSeamRatio(double sharp_edge_ratio);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr double CANNY_LOW = 100.0;
    static constexpr double CANNY_HIGH = 200.0;
    static constexpr double MARGIN_FRACTION = 0.1;
    static constexpr double SEAM_RATIO_MIN = 0.06;
    static constexpr double SEAM_RATIO_MAX = 0.20;
};

} // namespace probes

#endif // BLENDING_PROBE_HPP
