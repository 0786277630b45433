#ifndef EXIF_PROBE_HPP
#define EXIF_PROBE_HPP

#include "probe.hpp"
#include "exif_reader.hpp"

namespace probes {

// Metadata forensics on the original file bytes
class ExifProbe : public Probe {
public:
    ExifProbe() : Probe("exif") {}

    static ProbeResult assess(const ImageMetadata& metadata);

    // Returns the matching tool name, empty when none matches
    static std::string matchEditingTool(const std::string& software);
    static std::string matchGenerator(const std::string& text);

protected:
    ProbeResult analyze(const ProbeInput& input) const override;
};

} // namespace probes

#endif // EXIF_PROBE_HPP
