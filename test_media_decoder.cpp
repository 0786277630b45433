#include "src/media_decoder.hpp"
#include "src/fakescan_errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool condition, const std::string& label) {
    std::cout << (condition ? "✓ " : "✗ ") << label << std::endl;
    if (!condition) {
        failures++;
    }
}

static std::string base64Encode(const std::vector<unsigned char>& bytes) {
    static const char chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    unsigned int val = 0;
    int valb = -6;
    for (unsigned char c : bytes) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            out.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        out.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    while (out.size() % 4) {
        out.push_back('=');
    }
    return out;
}

static std::vector<unsigned char> encodedPng(int width, int height) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(30, 90, 200));
    std::vector<unsigned char> png;
    cv::imencode(".png", image, png);
    return png;
}

template <typename F>
static bool throwsDecodeError(F&& action) {
    try {
        action();
    } catch (const MediaDecodeError&) {
        return true;
    }
    return false;
}

static void testMediaType() {
    std::cout << "\n-- Media type detection --" << std::endl;

    check(MediaDecoder::detectMediaType("https://cdn.example.com/clip.mp4") == MediaType::VIDEO, ".mp4 is video");
    check(MediaDecoder::detectMediaType("https://cdn.example.com/CLIP.MOV") == MediaType::VIDEO, "extension match ignores case");
    check(MediaDecoder::detectMediaType("https://res.cloudinary.com/demo/video/upload/v1/sample") == MediaType::VIDEO,
          "video upload path is video");
    check(MediaDecoder::detectMediaType("data:video/mp4;base64,AAAA") == MediaType::VIDEO, "video data URL");
    check(MediaDecoder::detectMediaType("https://cdn.example.com/photo.jpg") == MediaType::IMAGE, ".jpg is an image");
    check(MediaDecoder::detectMediaType("data:image/png;base64,AAAA") == MediaType::IMAGE, "image data URL");
}

static void testSampling() {
    std::cout << "\n-- Frame sampling --" << std::endl;

    check(MediaDecoder::sampleIndices(100, 5) == std::vector<int>({0, 25, 50, 75, 99}), "last index clamped to the final frame");
    check(MediaDecoder::sampleIndices(3, 5) == std::vector<int>({0, 1, 2}), "short videos use every frame");
    check(MediaDecoder::sampleIndices(10, 1) == std::vector<int>({0}), "single sample is the first frame");
    check(MediaDecoder::sampleIndices(0, 5).empty(), "unknown frame count yields no samples");
}

static void testDecoding() {
    std::cout << "\n-- Decoding --" << std::endl;

    MediaDecoder decoder(5);
    std::vector<unsigned char> png = encodedPng(64, 48);

    DecodedMedia from_data = decoder.decode("data:image/png;base64," + base64Encode(png));
    check(from_data.type == MediaType::IMAGE && from_data.frames.size() == 1, "data URL decodes to one image");
    check(from_data.frames.front().cols == 64 && from_data.frames.front().rows == 48, "image dimensions kept");
    check(from_data.raw_bytes == png, "raw bytes kept for metadata probes");

    std::filesystem::path path = std::filesystem::temp_directory_path() / "fakescan_decoder_test.png";
    {
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    }
    DecodedMedia from_file = decoder.decode(path.string());
    check(from_file.frames.size() == 1 && from_file.source == path.string(), "local file decodes");
    std::filesystem::remove(path);

    check(throwsDecodeError([&]() { decoder.decode(""); }), "empty source is a decode error");
    check(throwsDecodeError([&]() { decoder.decode("/nonexistent/fakescan/image.png"); }), "missing file is a decode error");
    check(throwsDecodeError([&]() { decoder.decode("data:image/png;base64,bm90IGFuIGltYWdl"); }),
          "undecodable bytes are a decode error");
    check(throwsDecodeError([&]() { decoder.decodeVideo({0x00, 0x01, 0x02, 0x03}); }),
          "garbage video is a decode error");
}

int main() {
    std::cout << "\n=== Media Decoder Test ===\n" << std::endl;

    testMediaType();
    testSampling();
    testDecoding();

    std::cout << "\n=== " << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failures) ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
