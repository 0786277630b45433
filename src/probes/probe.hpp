#ifndef PROBE_HPP
#define PROBE_HPP

#include "../media_types.hpp"
#include <opencv2/opencv.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace probes {

using json = nlohmann::json;

struct ProbeResult {
    float score = 0.0f;               // suspicion, always in [0,1]
    json details = json::object();
};

// Inputs a probe may draw from. Probes ignore what they do not need.
struct ProbeInput {
    cv::Mat image;                    // full frame, BGR
    cv::Mat face_crop;                // square face crop, empty when no face
    std::optional<FaceInfo> face;     // bbox of face_crop in image space
    const std::vector<unsigned char>* raw_bytes = nullptr;
};

// Capability-checked heuristic signal extractor. evaluate() never throws.
class Probe {
public:
    explicit Probe(std::string name);
    virtual ~Probe() = default;

    const std::string& name() const { return name_; }

    virtual bool available() const { return enabled_; }
    void setEnabled(bool enabled) { enabled_ = enabled; }

    ProbeResult evaluate(const ProbeInput& input) const;

    static ProbeResult neutral(const std::string& error);

protected:
    virtual ProbeResult analyze(const ProbeInput& input) const = 0;

private:
    std::string name_;
    bool enabled_ = true;
};

} // namespace probes

#endif // PROBE_HPP
