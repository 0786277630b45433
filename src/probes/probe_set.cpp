#include "probe_set.hpp"
#include <iostream>

namespace probes {

ProbeSet::ProbeSet(std::shared_ptr<const dlib::shape_predictor> shape_predictor)
    : landmark(std::move(shape_predictor)) {
}

void ProbeSet::configure(const DetectionConfig& config) {
    for (Probe* probe : all()) {
        bool enabled = config.isProbeEnabled(probe->name());
        probe->setEnabled(enabled);
        if (!enabled) {
            std::cout << "Probe disabled by config: " << probe->name() << std::endl;
        }
    }
}

std::vector<Probe*> ProbeSet::all() {
    return {&frequency, &color, &noise, &compression, &exif, &blending,
            &landmark, &filter, &screen, &stylization, &scene};
}

std::vector<const Probe*> ProbeSet::all() const {
    return {&frequency, &color, &noise, &compression, &exif, &blending,
            &landmark, &filter, &screen, &stylization, &scene};
}

} // namespace probes
