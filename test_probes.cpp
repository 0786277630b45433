#include "src/probes/probe_set.hpp"
#include "src/probes/image_stats.hpp"
#include "src/probes/exif_reader.hpp"
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace probes;

static int failures = 0;

static void check(bool condition, const std::string& label) {
    std::cout << (condition ? "✓ " : "✗ ") << label << std::endl;
    if (!condition) {
        failures++;
    }
}

static bool near(double actual, double expected, double tolerance = 1e-5) {
    return std::abs(actual - expected) <= tolerance;
}

class ThrowingProbe : public Probe {
public:
    ThrowingProbe() : Probe("throwing") {}

protected:
    ProbeResult analyze(const ProbeInput&) const override {
        throw std::runtime_error("synthetic failure");
    }
};

class OverflowingProbe : public Probe {
public:
    OverflowingProbe() : Probe("overflowing") {}

protected:
    ProbeResult analyze(const ProbeInput&) const override {
        ProbeResult result;
        result.score = 3.5f;
        return result;
    }
};

static void appendU16(std::vector<unsigned char>& out, uint16_t value) {
    out.push_back(static_cast<unsigned char>(value & 0xFF));
    out.push_back(static_cast<unsigned char>(value >> 8));
}

static void appendU32(std::vector<unsigned char>& out, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xFF));
    }
}

static void appendAsciiEntry(std::vector<unsigned char>& out, uint16_t tag, uint32_t count, uint32_t offset) {
    appendU16(out, tag);
    appendU16(out, 2);
    appendU32(out, count);
    appendU32(out, offset);
}

// Little-endian TIFF with Make and Software in IFD0, wrapped in a JPEG APP1 segment
static std::vector<unsigned char> jpegWithExif(const std::string& make, const std::string& software) {
    std::vector<unsigned char> tiff = {'I', 'I'};
    appendU16(tiff, 42);
    appendU32(tiff, 8);

    uint32_t data_offset = 8 + 2 + 2 * 12 + 4;
    uint32_t make_count = static_cast<uint32_t>(make.size() + 1);
    uint32_t software_count = static_cast<uint32_t>(software.size() + 1);

    appendU16(tiff, 2);
    appendAsciiEntry(tiff, 0x010F, make_count, data_offset);
    appendAsciiEntry(tiff, 0x0131, software_count, data_offset + make_count);
    appendU32(tiff, 0);
    tiff.insert(tiff.end(), make.begin(), make.end());
    tiff.push_back(0);
    tiff.insert(tiff.end(), software.begin(), software.end());
    tiff.push_back(0);

    std::vector<unsigned char> jpeg = {0xFF, 0xD8, 0xFF, 0xE1};
    size_t segment_length = 2 + 6 + tiff.size();
    jpeg.push_back(static_cast<unsigned char>(segment_length >> 8));
    jpeg.push_back(static_cast<unsigned char>(segment_length & 0xFF));
    const char exif_header[] = {'E', 'x', 'i', 'f', 0, 0};
    jpeg.insert(jpeg.end(), exif_header, exif_header + 6);
    jpeg.insert(jpeg.end(), tiff.begin(), tiff.end());
    jpeg.push_back(0xFF);
    jpeg.push_back(0xD9);
    return jpeg;
}

// APP1 segment around a bare TIFF header whose IFD0 sits at ifd_offset, followed by any extra bytes
static std::vector<unsigned char> jpegWithIfdOffset(uint32_t ifd_offset, const std::vector<unsigned char>& extra = {}) {
    std::vector<unsigned char> tiff = {'I', 'I'};
    appendU16(tiff, 42);
    appendU32(tiff, ifd_offset);
    tiff.insert(tiff.end(), extra.begin(), extra.end());

    std::vector<unsigned char> jpeg = {0xFF, 0xD8, 0xFF, 0xE1};
    size_t segment_length = 2 + 6 + tiff.size();
    jpeg.push_back(static_cast<unsigned char>(segment_length >> 8));
    jpeg.push_back(static_cast<unsigned char>(segment_length & 0xFF));
    const char exif_header[] = {'E', 'x', 'i', 'f', 0, 0};
    jpeg.insert(jpeg.end(), exif_header, exif_header + 6);
    jpeg.insert(jpeg.end(), tiff.begin(), tiff.end());
    jpeg.push_back(0xFF);
    jpeg.push_back(0xD9);
    return jpeg;
}

// PNG signature followed by one tEXt chunk; CRCs are not checked by the reader
static std::vector<unsigned char> pngWithText(const std::string& keyword, const std::string& value) {
    std::vector<unsigned char> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    uint32_t length = static_cast<uint32_t>(keyword.size() + 1 + value.size());
    for (int shift = 24; shift >= 0; shift -= 8) {
        png.push_back(static_cast<unsigned char>((length >> shift) & 0xFF));
    }
    png.insert(png.end(), {'t', 'E', 'X', 't'});
    png.insert(png.end(), keyword.begin(), keyword.end());
    png.push_back(0);
    png.insert(png.end(), value.begin(), value.end());
    png.insert(png.end(), {0, 0, 0, 0});
    png.insert(png.end(), {0, 0, 0, 0, 'I', 'E', 'N', 'D', 0, 0, 0, 0});
    return png;
}

static cv::Mat noiseImage(int size, uint64_t seed) {
    cv::Mat image(size, size, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, cv::Scalar(0, 0, 0), cv::Scalar(255, 255, 255));
    return image;
}

static void testImageStats() {
    std::cout << "\n-- Image statistics --" << std::endl;

    check(near(clamp01(1.5f), 1.0) && near(clamp01(-0.2f), 0.0), "clamp01 bounds scores");
    check(clamp01(std::numeric_limits<float>::quiet_NaN()) == 0.0f, "clamp01 maps NaN to 0");
    check(near(percentile(std::vector<double>{1.0, 2.0, 3.0, 4.0}, 50.0), 2.5), "median interpolates");
    check(near(percentile(std::vector<double>{5.0, 1.0, 3.0}, 100.0), 5.0), "percentile sorts its input");
    check(near(mean({1.0, 2.0, 3.0, 4.0}), 2.5), "mean");
    check(near(populationVariance({1.0, 2.0, 3.0, 4.0}), 1.25), "population variance");
    check(near(populationVariance({}), 0.0), "variance of nothing is 0");

    cv::Mat flat(64, 64, CV_8UC1, cv::Scalar(128));
    check(near(correlation(flat, flat), 0.0), "correlation of a flat image is degenerate");
    check(near(laplacianVariance(flat), 0.0), "flat image has no Laplacian variance");
}

static void testProbeContract() {
    std::cout << "\n-- Probe contract --" << std::endl;

    ProbeInput input;
    input.image = noiseImage(64, 1);

    ThrowingProbe throwing;
    ProbeResult failed = throwing.evaluate(input);
    check(failed.score == 0.0f, "throwing probe degrades to 0");
    check(failed.details.value("error", "") == "synthetic failure", "error marker carries the message");

    OverflowingProbe overflowing;
    check(overflowing.evaluate(input).score == 1.0f, "scores are clamped to [0,1]");

    FrequencyProbe frequency;
    frequency.setEnabled(false);
    ProbeResult disabled = frequency.evaluate(input);
    check(disabled.score == 0.0f && disabled.details.value("error", "") == "backend_unavailable",
          "disabled probe is neutral");

    DetectionConfig config;
    config.probes["scene"] = false;
    ProbeSet set;
    set.configure(config);
    check(!set.scene.available() && set.frequency.available(), "config switches reach the probe set");
    check(set.all().size() == 11, "eleven probes in the set");
}

static void testPixelProbes() {
    std::cout << "\n-- Pixel probes --" << std::endl;

    check(near(ColorConsistencyProbe::suspicionFromSpread(20.0, 20.0), 0.0), "natural chroma spread is clean");
    check(near(ColorConsistencyProbe::suspicionFromSpread(40.0, 20.0), 0.5), "doubled a-spread gives 0.5");
    check(near(ColorConsistencyProbe::suspicionFromSpread(0.0, 0.0), 1.0), "flat chroma is fully suspicious");

    check(near(NoisePatternProbe::suspicionFromStd(1.0), 0.7), "uniform noise is suspicious");
    check(near(NoisePatternProbe::suspicionFromStd(10.0), 0.0), "natural noise is clean");
    check(near(NoisePatternProbe::suspicionFromStd(30.0), 0.5), "chaotic noise is half suspicious");

    ProbeInput flat;
    flat.image = cv::Mat(128, 128, CV_8UC3, cv::Scalar(90, 120, 160));
    NoisePatternProbe noise;
    ProbeResult flat_noise = noise.evaluate(flat);
    check(near(flat_noise.score, 0.7) && flat_noise.details.value("noise_suspicious", false),
          "flat image has suspiciously uniform noise");

    check(CompressionProbe::isDoubleCompressed(1.5), "mid-band blockiness is double compression");
    check(!CompressionProbe::isDoubleCompressed(1.0) && !CompressionProbe::isDoubleCompressed(2.5),
          "clean and heavy blockiness are not double compression");

    FrequencyProbe frequency;
    ProbeInput noisy;
    noisy.image = noiseImage(256, 2);
    ProbeResult spectrum = frequency.evaluate(noisy);
    check(spectrum.score >= 0.0f && spectrum.score <= 1.0f && spectrum.details.is_object(),
          "frequency probe returns a bounded score");
}

static void testFaceProbes() {
    std::cout << "\n-- Face probes --" << std::endl;

    check(BlendingProbe::isSeamRatio(0.1), "seam ratio inside the band");
    check(!BlendingProbe::isSeamRatio(0.02) && !BlendingProbe::isSeamRatio(0.3), "seam ratio outside the band");

    cv::Mat mask = BlendingProbe::boundaryMask(cv::Size(200, 200), cv::Rect(50, 50, 100, 100));
    check(mask.at<uchar>(50, 100) != 0, "boundary mask covers the bbox edge");
    check(mask.at<uchar>(100, 100) == 0, "boundary mask leaves the face interior out");

    BlendingProbe blending;
    ProbeInput no_face;
    no_face.image = noiseImage(64, 3);
    check(blending.evaluate(no_face).details.value("error", "") == "no_face", "blending needs a face");

    check(LandmarkProbe::isSymmetryAbnormal(0.95), "near-perfect symmetry is abnormal");
    check(LandmarkProbe::isSymmetryAbnormal(0.4), "strong asymmetry is abnormal");
    check(!LandmarkProbe::isSymmetryAbnormal(0.75), "ordinary symmetry is normal");
    check(LandmarkProbe::isRatioAbnormal(0.3) && LandmarkProbe::isRatioAbnormal(4.0), "eye/mouth ratio bounds");
    check(!LandmarkProbe::isRatioAbnormal(1.2), "ordinary eye/mouth ratio");

    cv::Mat flat(128, 128, CV_8UC1, cv::Scalar(100));
    check(near(LandmarkProbe::textureStd(flat), 0.0), "flat crop has no texture");
}

static void testMetadataProbes() {
    std::cout << "\n-- Metadata probes --" << std::endl;

    std::vector<unsigned char> jpeg = jpegWithExif("Canon", "Adobe Photoshop 25.0");
    ImageMetadata metadata = ExifReader::read(jpeg);
    check(metadata.has_exif, "APP1 Exif segment found");
    check(metadata.get("Make") == "Canon", "Make tag read");
    check(metadata.get("Software") == "Adobe Photoshop 25.0", "Software tag read");

    ProbeResult edited = ExifProbe::assess(metadata);
    check(edited.details.value("editing_software_detected", false), "Photoshop flagged as editing software");
    check(!edited.details.value("metadata_stripped", true), "camera make keeps metadata intact");
    check(near(edited.score, 0.4), "editing tool scores 0.4");

    ImageMetadata png = ExifReader::read(pngWithText("parameters", "Steps: 30, Sampler: Euler a"));
    check(png.get("png:parameters") == "Steps: 30, Sampler: Euler a", "PNG text chunk read");
    ProbeResult generated = ExifProbe::assess(png);
    check(generated.details.value("generator_detected", false), "diffusion parameters mark a generator");
    check(generated.details.value("metadata_stripped", false), "no camera tags means stripped");
    check(near(generated.score, 0.8), "generator plus stripped scores 0.8");

    check(ExifProbe::matchEditingTool("FaceTune 2") == "facetune", "tool match is case-insensitive");
    check(ExifProbe::matchGenerator("Made with Midjourney v6") == "midjourney", "generator match");
    check(ExifProbe::matchEditingTool("Camera firmware 1.0").empty(), "firmware is not an editing tool");

    std::vector<unsigned char> garbage = {0x00, 0x01, 0x02};
    check(!ExifReader::read(garbage).has_exif, "unknown container yields no metadata");

    ImageMetadata far_ifd = ExifReader::read(jpegWithIfdOffset(0xFFFFFFFF));
    check(far_ifd.has_exif && far_ifd.tags.empty(), "IFD offset past the segment is ignored");
    ImageMetadata wrapped_ifd = ExifReader::read(jpegWithIfdOffset(0xFFFFFFF8));
    check(wrapped_ifd.tags.empty(), "IFD offset near the 32-bit limit is ignored");

    // One Exif IFD pointer entry aimed outside the segment
    std::vector<unsigned char> pointer_ifd;
    appendU16(pointer_ifd, 1);
    appendU16(pointer_ifd, 0x8769);
    appendU16(pointer_ifd, 4);
    appendU32(pointer_ifd, 1);
    appendU32(pointer_ifd, 0xFFFFFFFE);
    appendU32(pointer_ifd, 0);
    check(ExifReader::read(jpegWithIfdOffset(8, pointer_ifd)).tags.empty(), "Exif IFD pointer past the segment is ignored");

    std::vector<unsigned char> truncated = jpegWithExif("Canon", "Adobe Photoshop 25.0");
    truncated.resize(30);
    check(ExifReader::read(truncated).tags.empty(), "truncated APP1 segment yields no tags");

    ProbeInput hostile;
    hostile.image = noiseImage(32, 5);
    std::vector<unsigned char> hostile_bytes = jpegWithIfdOffset(0xFFFFFFFF);
    hostile.raw_bytes = &hostile_bytes;
    check(ExifProbe().evaluate(hostile).score >= 0.0f, "exif probe survives a hostile IFD offset");

    ExifProbe exif;
    ProbeInput no_bytes;
    no_bytes.image = noiseImage(32, 4);
    check(exif.evaluate(no_bytes).details.value("error", "") == "no_raw_bytes", "exif needs raw bytes");
}

static void testSceneProbes() {
    std::cout << "\n-- Scene probes --" << std::endl;

    check(ScreenProbe::isDisplayAspect(16.0 / 9.0), "16:9 is a display");
    check(ScreenProbe::isDisplayAspect(9.0 / 16.0), "portrait 9:16 is a display");
    check(!ScreenProbe::isDisplayAspect(1.0), "square is not a display");

    StyleDecision photo = StylizationProbe::decide(StyleComponents());
    check(!photo.is_stylized && photo.fake_boost == 0.0f, "no stylization signal is photorealistic");

    StyleComponents anime;
    anime.skin = 1.0f;
    anime.edge = 1.0f;
    anime.color = 1.0f;
    anime.outline = 1.0f;
    StyleDecision anime_decision = StylizationProbe::decide(anime);
    check(anime_decision.is_stylized && anime_decision.style_type == StyleType::ANIME, "strong outlines and skin are anime");
    check(near(anime_decision.fake_boost, 0.4), "stylized boost capped at 0.4");

    StyleComponents uncertain;
    uncertain.skin = 0.6f;
    uncertain.edge = 0.6f;
    uncertain.color = 0.5f;
    uncertain.outline = 0.2f;
    StyleDecision uncertain_decision = StylizationProbe::decide(uncertain);
    check(uncertain_decision.is_stylized && uncertain_decision.style_type == StyleType::UNKNOWN,
          "middling signal is an unknown style");
    check(near(uncertain_decision.fake_boost, 0.515 * 0.3), "uncertain boost is combined * 0.3");

    check(SceneProbe::classify(0.7f) == SceneVerdict::LIKELY_AI_GENERATED, "0.7 is likely AI");
    check(SceneProbe::classify(0.5f) == SceneVerdict::SUSPICIOUS, "0.5 is suspicious");
    check(SceneProbe::classify(0.2f) == SceneVerdict::LIKELY_AUTHENTIC, "0.2 is authentic");

    GeneratorMatch real_match;
    check(near(SceneProbe::combine(real_match, 0.4f, 1.0f), 0.1), "likely-real match ignores generator confidence");
    GeneratorMatch dalle;
    dalle.generator = "dalle";
    dalle.confidence = 0.8f;
    dalle.likely_real = false;
    check(near(SceneProbe::combine(dalle, 0.4f, 0.6f), 0.4 + 0.1 + 0.1), "combined scene score");
}

int main() {
    std::cout << "\n=== Heuristic Probe Test ===\n" << std::endl;

    try {
        testImageStats();
        testProbeContract();
        testPixelProbes();
        testFaceProbes();
        testMetadataProbes();
        testSceneProbes();
    } catch (const std::exception& e) {
        std::cerr << "✗ Unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failures) ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
