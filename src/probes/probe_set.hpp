#ifndef PROBE_SET_HPP
#define PROBE_SET_HPP

#include "probe.hpp"
#include "frequency_probe.hpp"
#include "color_consistency_probe.hpp"
#include "noise_pattern_probe.hpp"
#include "compression_probe.hpp"
#include "exif_probe.hpp"
#include "blending_probe.hpp"
#include "landmark_probe.hpp"
#include "filter_probe.hpp"
#include "screen_probe.hpp"
#include "stylization_probe.hpp"
#include "scene_probe.hpp"
#include "../detection_config.hpp"
#include <memory>
#include <vector>

namespace probes {

// The full battery of heuristic probes, read-only after construction
struct ProbeSet {
    FrequencyProbe frequency;
    ColorConsistencyProbe color;
    NoisePatternProbe noise;
    CompressionProbe compression;
    ExifProbe exif;
    BlendingProbe blending;
    LandmarkProbe landmark;
    FilterProbe filter;
    ScreenProbe screen;
    StylizationProbe stylization;
    SceneProbe scene;

    explicit ProbeSet(std::shared_ptr<const dlib::shape_predictor> shape_predictor = nullptr);

    // Applies the per-probe switches from the config
    void configure(const DetectionConfig& config);

    std::vector<Probe*> all();
    std::vector<const Probe*> all() const;
};

} // namespace probes

#endif // PROBE_SET_HPP
