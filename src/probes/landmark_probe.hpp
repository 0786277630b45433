#ifndef LANDMARK_PROBE_HPP
#define LANDMARK_PROBE_HPP

#include "probe.hpp"
#include <dlib/image_processing.h>
#include <memory>

namespace probes {

// Facial symmetry and region balance on a face crop. A loaded 68-point shape predictor
// adds landmark geometry to the details.
class LandmarkProbe : public Probe {
public:
    explicit LandmarkProbe(std::shared_ptr<const dlib::shape_predictor> shape_predictor = nullptr);

    // 1 minus normalized difference between the left half and the mirrored right half of the edge map
    static double edgeSymmetry(const cv::Mat& gray);

    // Edge density of the eye strip over that of the mouth strip
    static double eyeMouthEdgeRatio(const cv::Mat& gray);

    static double textureStd(const cv::Mat& gray);

    static bool isSymmetryAbnormal(double symmetry);
    static bool isRatioAbnormal(double ratio);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;

private:
    std::shared_ptr<const dlib::shape_predictor> shape_predictor_;

    // Distance symmetry of jaw landmark pairs around the nose tip
    float landmarkSymmetry(const cv::Mat& face_crop) const;

    static constexpr int ANALYSIS_SIZE = 256;
    static constexpr double SYMMETRY_TOO_PERFECT = 0.92;
    static constexpr double SYMMETRY_TOO_LOW = 0.55;
    static constexpr double RATIO_MIN = 0.5;
    static constexpr double RATIO_MAX = 3.0;
    static constexpr double TEXTURE_TOO_SMOOTH = 8.0;
    static constexpr double TEXTURE_TOO_NOISY = 60.0;
};

} // namespace probes

#endif // LANDMARK_PROBE_HPP
