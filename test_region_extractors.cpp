#include "src/region_extractor.hpp"
#include "src/frame_set_builder.hpp"
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

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

static cv::Mat gradientImage(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x % 256), static_cast<uchar>(y % 256),
                                                  static_cast<uchar>((x + y) % 256));
        }
    }
    return image;
}

static bool isOptimalSquare(const cv::Mat& image, int size) {
    return !image.empty() && image.cols == size && image.rows == size && image.type() == CV_8UC3;
}

static std::map<std::string, AnalysisFrame> byName(const std::vector<AnalysisFrame>& frames) {
    std::map<std::string, AnalysisFrame> named;
    for (const AnalysisFrame& frame : frames) {
        named[frame.name] = frame;
    }
    return named;
}

static void testCropGeometry() {
    std::cout << "\n-- Crop geometry --" << std::endl;

    cv::Rect inside = RegionExtractor::marginRect(cv::Rect(100, 100, 100, 100), 0.3, cv::Size(640, 480));
    check(inside == cv::Rect(70, 70, 160, 160), "30% margin on every side");

    cv::Rect corner = RegionExtractor::marginRect(cv::Rect(10, 10, 100, 100), 0.3, cv::Size(640, 480));
    check(corner.x == 0 && corner.y == 0, "margin clamped at the top-left corner");
    check(corner.br().x == 140 && corner.br().y == 140, "far edges keep their margin");

    cv::Rect edge = RegionExtractor::marginRect(cv::Rect(580, 420, 60, 60), 0.3, cv::Size(640, 480));
    check(edge.br().x == 640 && edge.br().y == 480, "margin clamped at the bottom-right corner");

    cv::Rect eyes = RegionExtractor::eyeRect(cv::Size(384, 384));
    check(eyes.y == 76 && eyes.y + eyes.height == 172, "eye band spans 20% to 45% of the height");
    check(eyes.x == 38 && eyes.x + eyes.width == 345, "eye band spans 10% to 90% of the width");

    cv::Rect mouth = RegionExtractor::mouthRect(cv::Size(384, 384));
    check(mouth.y == 211 && mouth.y + mouth.height == 326, "mouth band spans 55% to 85% of the height");
    check(mouth.x == 76 && mouth.x + mouth.width == 307, "mouth band spans 20% to 80% of the width");
}

static void testDerivedImages() {
    std::cout << "\n-- Derived images --" << std::endl;

    DetectionConfig config;
    RegionExtractor extractor(config);
    const int size = extractor.optimalSize();
    cv::Mat image = gradientImage(640, 480);

    FaceInfo face;
    face.bbox = cv::Rect(200, 120, 200, 200);
    cv::Mat crop = extractor.cropFace(image, face);
    check(isOptimalSquare(crop, size), "face crop is an optimal-size BGR square");

    check(isOptimalSquare(extractor.eyeStrip(crop), size), "eye strip resized to the optimal square");
    check(isOptimalSquare(extractor.mouthStrip(crop), size), "mouth strip resized to the optimal square");
    check(isOptimalSquare(extractor.edgeMap(crop), size), "edge map is three-channel");
    check(isOptimalSquare(extractor.sharpened(crop), size), "sharpened variant");
    check(isOptimalSquare(extractor.rescaled(crop, 0.7), size), "rescaled variant returns to the optimal size");
    check(isOptimalSquare(extractor.frequencyMap(crop), size), "frequency map");
    check(isOptimalSquare(extractor.colorMap(crop), size), "color map");
    check(isOptimalSquare(extractor.noiseMap(crop), size), "noise map");
    check(isOptimalSquare(extractor.centerCrop(image, 0.35), size), "center crop");
    check(isOptimalSquare(extractor.mirrored(image), size), "mirror");

    cv::Mat flat(64, 64, CV_8UC3, cv::Scalar(100, 100, 100));
    cv::Mat contrasted = extractor.contrastEnhanced(flat, 1.3);
    check(near(cv::mean(contrasted)[0], 100.0, 1.0), "contrast stretch keeps the mean of a flat image");

    FaceInfo outside;
    outside.bbox = cv::Rect(700, 500, 50, 50);
    check(extractor.cropFace(image, outside).empty(), "face outside the image yields no crop");

    DetectionConfig plain = config;
    plain.enhance_face_crops = false;
    RegionExtractor raw(plain);
    cv::Mat raw_crop = raw.cropFace(image, face);
    check(isOptimalSquare(raw_crop, size), "crop without enhancement");
    check(cv::norm(raw_crop, crop, cv::NORM_L1) > 0.0, "enhancement changes every crop");
}

static void testWeights() {
    std::cout << "\n-- Vote weights --" << std::endl;

    check(near(FrameSetBuilder::faceBaseWeight(0), 5.0), "first face weight 5.0");
    check(near(FrameSetBuilder::faceBaseWeight(1), 4.7), "second face weight 4.7");
    check(FrameSetBuilder::faceBaseWeight(0) > FrameSetBuilder::faceBaseWeight(3), "earlier faces outweigh later ones");
    check(near(FrameSetBuilder::multiScaleWeight(5.0f, 1.0), 5.0), "full scale keeps the base weight");
    check(near(FrameSetBuilder::multiScaleWeight(5.0f, 0.7), 2.8), "0.7 scale weight is base * 0.7 * 0.8");
    check(near(FrameSetBuilder::multiScaleWeight(3.0f, 0.5), 2.0), "scaled weight never drops below 2.0");
}

static void testImageFrameSet() {
    std::cout << "\n-- Image frame set --" << std::endl;

    DetectionConfig config;
    RegionExtractor extractor(config);
    FrameSetBuilder builder(config, extractor);
    cv::Mat image = gradientImage(640, 480);

    FaceRegion region;
    region.face.bbox = cv::Rect(200, 120, 200, 200);
    region.face.index = 0;
    region.rank = 0;
    region.crop = extractor.cropFace(image, region.face);
    region.color_suspicion = 0.5f;
    region.noise_suspicion = 0.25f;

    std::vector<AnalysisFrame> single = builder.buildImageFrames(image, {region});
    auto named = byName(single);
    check(single.size() == 15, "one face yields 15 frames");
    check(named.count("face1_s100") && near(named["face1_s100"].weight, 5.0), "face crop at full weight");
    check(named.count("face1_s70") && near(named["face1_s70"].weight, 2.8), "multi-scale face crop");
    check(named.count("face1_fft") && named["face1_fft"].kind == FrameKind::FACE_FFT, "face frequency frame");
    check(near(named["face1_color"].weight, 1.2 * 1.5), "color weight scaled by color suspicion");
    check(near(named["face1_noise"].weight, 1.25), "noise weight scaled by noise suspicion");
    check(named.count("face1_eyes") && named.count("face1_eyes_edge") && named.count("face1_mouth"),
          "eye and mouth strips present");
    check(named.count("mirror") == 1, "single face adds the mirror frame");
    check(near(named["full"].weight, 1.0), "full image at low weight when faces exist");
    check(named.count("center_35") == 0, "no center crops when faces exist");

    bool all_sized = true;
    for (const AnalysisFrame& frame : single) {
        all_sized = all_sized && isOptimalSquare(frame.image, extractor.optimalSize());
    }
    check(all_sized, "every frame is an optimal-size square");

    FaceRegion second = region;
    second.face.bbox = cv::Rect(20, 20, 120, 120);
    second.face.index = 3;
    second.rank = 1;
    second.crop = extractor.cropFace(image, second.face);
    std::vector<AnalysisFrame> pair = builder.buildImageFrames(image, {region, second});
    auto pair_named = byName(pair);
    check(pair.size() == 24, "two faces yield 24 frames");
    check(near(pair_named["face2_s100"].weight, 4.7), "second face crop weight 4.7");
    check(pair_named["face2_s100"].face_index == 1, "second kept face frames carry its rank, not the raw detection index");
    check(pair_named.count("mirror") == 0, "group photos skip the mirror frame");

    std::vector<AnalysisFrame> scene = builder.buildImageFrames(image, {});
    auto scene_named = byName(scene);
    check(scene.size() == 12, "no face yields 12 frames");
    check(near(scene_named["full"].weight, 3.0), "full image weight rises without faces");
    check(near(scene_named["center_35"].weight, 4.5) && near(scene_named["center_65"].weight, 3.0),
          "tighter center crops vote more");
    check(near(scene_named["center_35_fft"].weight, 2.25), "center frequency maps vote at half weight");

    check(builder.buildImageFrames(cv::Mat(), {}).empty(), "empty image yields no frames");
}

static void testVideoFrameSet() {
    std::cout << "\n-- Video frame set --" << std::endl;

    DetectionConfig config;
    RegionExtractor extractor(config);
    FrameSetBuilder builder(config, extractor);

    std::vector<VideoSample> samples;
    for (int j = 0; j < 3; j++) {
        VideoSample sample;
        sample.frame = gradientImage(320, 240);
        sample.frame_index = j * 10;
        FaceInfo face;
        face.bbox = cv::Rect(100, 60, 120, 120);
        sample.faces.push_back(face);
        sample.crops.push_back(extractor.cropFace(sample.frame, face));
        samples.push_back(sample);
    }

    std::vector<AnalysisFrame> frames = builder.buildVideoFrames(samples);
    auto named = byName(frames);
    check(frames.size() == 7, "three one-face samples yield 7 frames");
    check(near(named["f1_face1"].weight, 3.5) && near(named["f2_face1"].weight, 2.5),
          "first and last samples vote more");
    check(named.count("f1_face1_fft") && named.count("f3_face1_fft") && !named.count("f2_face1_fft"),
          "frequency frames on even samples");
    check(named.count("f1_face1_eyes") && named.count("f3_face1_eyes") && !named.count("f2_face1_eyes"),
          "eye frames on the first and last samples");
    check(named["f2_face1"].video_frame == 1, "frames carry their sample index");

    for (VideoSample& sample : samples) {
        sample.faces.clear();
        sample.crops.clear();
    }
    std::vector<AnalysisFrame> faceless = builder.buildVideoFrames(samples);
    auto faceless_named = byName(faceless);
    check(faceless.size() == 3, "faceless samples yield one frame each");
    check(near(faceless_named["frame_1"].weight, 2.0) && near(faceless_named["frame_2"].weight, 1.5),
          "faceless edge samples vote more");

    // Middle sample has a face whose crop came out empty
    samples[1].faces.push_back(FaceInfo());
    samples[1].crops.push_back(cv::Mat());
    std::vector<AnalysisFrame> empty_crop = builder.buildVideoFrames(samples);
    auto empty_crop_named = byName(empty_crop);
    check(empty_crop.size() == 3, "sample with only empty crops still contributes a frame");
    check(empty_crop_named.count("frame_2") && near(empty_crop_named["frame_2"].weight, 1.5)
          && empty_crop_named["frame_2"].video_frame == 1,
          "empty crops fall back to the whole frame");
}

int main() {
    std::cout << "\n=== Region Extraction Test ===\n" << std::endl;

    try {
        testCropGeometry();
        testDerivedImages();
        testWeights();
        testImageFrameSet();
        testVideoFrameSet();
    } catch (const std::exception& e) {
        std::cerr << "✗ Unexpected exception: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << " (" << failures << " failures) ===" << std::endl;
    return failures == 0 ? 0 : 1;
}
