#ifndef COLOR_CONSISTENCY_PROBE_HPP
#define COLOR_CONSISTENCY_PROBE_HPP

#include "probe.hpp"

namespace probes {

// Deviation of LAB chroma spread from the natural skin value
class ColorConsistencyProbe : public Probe {
public:
    ColorConsistencyProbe() : Probe("color") {}

    static float suspicionFromSpread(double a_std, double b_std);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr double OPTIMAL_STD = 20.0;
};

} // namespace probes

#endif // COLOR_CONSISTENCY_PROBE_HPP
