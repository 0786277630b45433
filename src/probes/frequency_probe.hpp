#ifndef FREQUENCY_PROBE_HPP
#define FREQUENCY_PROBE_HPP

#include "probe.hpp"

namespace probes {

// GAN fingerprint check: radial spectral decay plus high-frequency peak density.
class FrequencyProbe : public Probe {
public:
    FrequencyProbe() : Probe("frequency") {}

    // Least-squares slope of mean log magnitude against log radius
    static double radialSlope(const cv::Mat& log_spectrum);

    // Fraction of outer-band spectrum pixels above mean + k*sigma of that band
    static double highFrequencyPeakDensity(const cv::Mat& log_spectrum);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr int ANALYSIS_SIZE = 256;
    static constexpr double PEAK_SIGMA = 3.0;
    static constexpr double HIGH_FREQ_START = 0.5;   // fraction of max radius
};

} // namespace probes

#endif // FREQUENCY_PROBE_HPP
