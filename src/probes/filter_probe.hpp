#ifndef FILTER_PROBE_HPP
#define FILTER_PROBE_HPP

#include "probe.hpp"

namespace probes {

// Social media beauty/colour filter detection. Score doubles as filter intensity.
class FilterProbe : public Probe {
public:
    FilterProbe() : Probe("filter") {}

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr double SMOOTH_LAPLACIAN_VAR = 100.0;
    static constexpr double SHARP_EDGE_DENSITY = 0.05;
    static constexpr double LOW_HUE_ENTROPY = 0.55;
    static constexpr double ORANGE_TEAL_FRACTION = 0.1;
    static constexpr double VIGNETTE_CORRELATION = -0.3;
    static constexpr double SKIN_FRACTION_MIN = 0.05;
    static constexpr double SKIN_LUMA_STD = 12.0;
    static constexpr double SATURATION_BOOSTED = 120.0;
    static constexpr double SATURATION_MUTED = 25.0;
    static constexpr double SATURATION_STD_UNIFORM = 25.0;
};

} // namespace probes

#endif // FILTER_PROBE_HPP
