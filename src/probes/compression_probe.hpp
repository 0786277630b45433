#ifndef COMPRESSION_PROBE_HPP
#define COMPRESSION_PROBE_HPP

#include "probe.hpp"

namespace probes {

struct BlockStatistics {
    double boundary_diff = 0.0;   // mean step across 8x8 block borders
    double interior_diff = 0.0;   // mean step inside blocks
    double blockiness = 1.0;      // boundary / interior
};

// JPEG grid discontinuity analysis
class CompressionProbe : public Probe {
public:
    CompressionProbe() : Probe("compression") {}

    static BlockStatistics measureBlocks(const cv::Mat& gray);

    // Mid-band blockiness marks recompression of an already compressed image
    static bool isDoubleCompressed(double blockiness);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    static constexpr int BLOCK_SIZE = 8;
    static constexpr double DOUBLE_COMPRESSION_MIN = 1.15;
    static constexpr double DOUBLE_COMPRESSION_MAX = 2.0;
};

} // namespace probes

#endif // COMPRESSION_PROBE_HPP
