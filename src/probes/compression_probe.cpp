#include "compression_probe.hpp"
#include "image_stats.hpp"
#include <cmath>

namespace probes {

BlockStatistics CompressionProbe::measureBlocks(const cv::Mat& gray) {
    BlockStatistics stats;
    cv::Mat img;
    gray.convertTo(img, CV_32F);

    double boundary_sum = 0.0, interior_sum = 0.0;
    long boundary_count = 0, interior_count = 0;

    // Horizontal steps
    for (int y = 0; y < img.rows; y++) {
        const float* row = img.ptr<float>(y);
        for (int x = 1; x < img.cols; x++) {
            double step = std::abs(row[x] - row[x - 1]);
            if (x % BLOCK_SIZE == 0) {
                boundary_sum += step;
                boundary_count++;
            } else {
                interior_sum += step;
                interior_count++;
            }
        }
    }

    // Vertical steps
    for (int y = 1; y < img.rows; y++) {
        const float* row = img.ptr<float>(y);
        const float* prev = img.ptr<float>(y - 1);
        bool on_boundary = (y % BLOCK_SIZE == 0);
        for (int x = 0; x < img.cols; x++) {
            double step = std::abs(row[x] - prev[x]);
            if (on_boundary) {
                boundary_sum += step;
                boundary_count++;
            } else {
                interior_sum += step;
                interior_count++;
            }
        }
    }

    if (boundary_count > 0) {
        stats.boundary_diff = boundary_sum / boundary_count;
    }
    if (interior_count > 0) {
        stats.interior_diff = interior_sum / interior_count;
    }
    stats.blockiness = stats.interior_diff > 1e-6 ? stats.boundary_diff / stats.interior_diff : 1.0;
    return stats;
}

bool CompressionProbe::isDoubleCompressed(double blockiness) {
    return blockiness > DOUBLE_COMPRESSION_MIN && blockiness < DOUBLE_COMPRESSION_MAX;
}

ProbeResult CompressionProbe::analyze(const ProbeInput& input) const {
    if (input.image.empty()) {
        return neutral("empty_input");
    }

    cv::Mat gray = toGray(input.image);
    if (gray.cols < 2 * BLOCK_SIZE || gray.rows < 2 * BLOCK_SIZE) {
        return neutral("image_too_small");
    }

    BlockStatistics stats = measureBlocks(gray);
    bool double_compressed = isDoubleCompressed(stats.blockiness);
    bool heavy = stats.blockiness >= DOUBLE_COMPRESSION_MAX;

    ProbeResult result;
    result.score = double_compressed ? 0.6f : (heavy ? 0.3f : 0.0f);
    result.details = {
        {"block_boundary_diff", stats.boundary_diff},
        {"block_interior_diff", stats.interior_diff},
        {"blockiness", stats.blockiness},
        {"double_compression_detected", double_compressed},
        {"heavy_compression", heavy}
    };
    return result;
}

} // namespace probes
