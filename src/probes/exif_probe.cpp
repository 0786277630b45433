#include "exif_probe.hpp"
#include <algorithm>
#include <cctype>

namespace probes {

namespace {

const std::vector<std::string> EDITING_TOOLS = {
    "photoshop", "gimp", "lightroom", "affinity", "pixelmator", "snapseed", "facetune",
    "faceapp", "picsart", "meitu", "beautyplus", "canva", "remini", "lensa", "reface",
    "deepfacelab", "faceswap", "airbrush", "youcam"
};

const std::vector<std::string> GENERATORS = {
    "midjourney", "dall-e", "dalle", "stable diffusion", "stablediffusion", "novelai",
    "firefly", "leonardo", "comfyui", "automatic1111", "invokeai", "imagen", "flux"
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string findIn(const std::string& text, const std::vector<std::string>& names) {
    std::string lower = toLower(text);
    for (const auto& name : names) {
        if (lower.find(name) != std::string::npos) {
            return name;
        }
    }
    return "";
}

} // namespace

std::string ExifProbe::matchEditingTool(const std::string& software) {
    return findIn(software, EDITING_TOOLS);
}

std::string ExifProbe::matchGenerator(const std::string& text) {
    return findIn(text, GENERATORS);
}

ProbeResult ExifProbe::assess(const ImageMetadata& metadata) {
    std::string software = metadata.get("Software");
    if (software.empty()) {
        software = metadata.get("png:Software");
    }

    bool has_camera = metadata.has("Make") || metadata.has("Model") || metadata.has("DateTimeOriginal");
    bool metadata_stripped = !has_camera;

    std::string tool = matchEditingTool(software);
    std::string generator = matchGenerator(software + " " + metadata.get("ImageDescription") + " " +
                                           metadata.get("Artist"));
    // Diffusion front-ends embed their generation settings as PNG text
    if (generator.empty() && (metadata.has("png:parameters") || metadata.has("png:prompt"))) {
        generator = "diffusion_parameters";
    }

    bool date_mismatch = false;
    std::string original = metadata.get("DateTimeOriginal");
    std::string digitized = metadata.get("DateTimeDigitized");
    std::string modified = metadata.get("DateTime");
    if (!original.empty() && !digitized.empty() && original != digitized) {
        date_mismatch = true;
    }
    if (!original.empty() && modified.size() >= 10 && original.size() >= 10 &&
        modified.compare(0, 10, original, 0, 10) != 0) {
        date_mismatch = true;
    }

    float score = 0.0f;
    if (metadata_stripped) {
        score += 0.2f;
    }
    if (!generator.empty()) {
        score += 0.6f;
    } else if (!tool.empty()) {
        score += 0.4f;
    }
    if (date_mismatch) {
        score += 0.2f;
    }

    ProbeResult result;
    result.score = std::min(1.0f, score);
    result.details = {
        {"has_exif", metadata.has_exif},
        {"metadata_stripped", metadata_stripped},
        {"editing_software_detected", !tool.empty() || !generator.empty()},
        {"generator_detected", !generator.empty()},
        {"software", software},
        {"matched_tool", generator.empty() ? tool : generator},
        {"camera_make", metadata.get("Make")},
        {"camera_model", metadata.get("Model")},
        {"date_mismatch", date_mismatch},
        {"tag_count", metadata.tags.size()}
    };
    return result;
}

ProbeResult ExifProbe::analyze(const ProbeInput& input) const {
    if (input.raw_bytes == nullptr || input.raw_bytes->empty()) {
        return neutral("no_raw_bytes");
    }
    return assess(ExifReader::read(*input.raw_bytes));
}

} // namespace probes
