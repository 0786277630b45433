#include "probe.hpp"
#include "image_stats.hpp"
#include <iostream>

namespace probes {

Probe::Probe(std::string name) : name_(std::move(name)) {
}

ProbeResult Probe::neutral(const std::string& error) {
    ProbeResult result;
    result.score = 0.0f;
    result.details["error"] = error;
    return result;
}

ProbeResult Probe::evaluate(const ProbeInput& input) const {
    if (!available()) {
        return neutral("backend_unavailable");
    }

    try {
        ProbeResult result = analyze(input);
        result.score = clamp01(result.score);
        return result;
    } catch (const cv::Exception& e) {
        std::cerr << "Probe " << name_ << " failed in OpenCV: " << e.what() << std::endl;
        return neutral(e.what());
    } catch (const std::exception& e) {
        std::cerr << "Probe " << name_ << " failed: " << e.what() << std::endl;
        return neutral(e.what());
    }
}

} // namespace probes
