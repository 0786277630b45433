#ifndef SCREEN_PROBE_HPP
#define SCREEN_PROBE_HPP

#include "probe.hpp"

namespace probes {

// Monitor/UI footage detection (games, code editors, desktops).
// Score is the weighted sum of boolean indicators and serves as detection confidence.
class ScreenProbe : public Probe {
public:
    ScreenProbe() : Probe("screen") {}

    // Large bright quadrilaterals whose aspect matches a display
    static int countScreenRectangles(const cv::Mat& gray);
    static bool isDisplayAspect(double aspect);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr double RECTANGLE_WEIGHT = 0.25;
    static constexpr double SATURATION_WEIGHT = 0.15;
    static constexpr double DARK_BRIGHT_WEIGHT = 0.15;
    static constexpr double EDGE_WEIGHT = 0.15;
    static constexpr double GRADIENT_WEIGHT = 0.15;
    static constexpr double UNIFORM_BLOCK_WEIGHT = 0.15;

    static constexpr double HIGH_SATURATION_RATIO = 0.25;
    static constexpr double DARK_RATIO = 0.4;
    static constexpr double BRIGHT_RATIO = 0.02;
    static constexpr double EDGE_DENSITY = 0.12;
    static constexpr double AXIS_ALIGNED_RATIO = 0.6;
    static constexpr double UNIFORM_BLOCK_RATIO = 0.3;
};

} // namespace probes

#endif // SCREEN_PROBE_HPP
