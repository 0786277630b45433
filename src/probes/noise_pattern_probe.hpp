#ifndef NOISE_PATTERN_PROBE_HPP
#define NOISE_PATTERN_PROBE_HPP

#include "probe.hpp"

namespace probes {

// Sensor-noise plausibility from the high-pass residual
class NoisePatternProbe : public Probe {
public:
    NoisePatternProbe() : Probe("noise") {}

    static float suspicionFromStd(double noise_std);

    // Residual of gray minus its 5x5 Gaussian blur, CV_32F
    static cv::Mat residual(const cv::Mat& image);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr double TOO_UNIFORM_STD = 3.0;
    static constexpr double TOO_CHAOTIC_STD = 25.0;
};

} // namespace probes

#endif // NOISE_PATTERN_PROBE_HPP
