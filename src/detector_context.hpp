#ifndef DETECTOR_CONTEXT_HPP
#define DETECTOR_CONTEXT_HPP

#include "detection_config.hpp"
#include "face_locator.hpp"
#include "frame_classifier.hpp"
#include "region_extractor.hpp"
#include "probes/probe_set.hpp"
#include <memory>
#include <string>

// Process-wide, load-once state: config, classifier weights, face detector and probes.
// Built at startup and passed by reference into every analysis; read-only afterwards.
class DetectorContext {
public:
    explicit DetectorContext(const DetectionConfig& config);

    // Injects ready components; probes get no shape predictor
    DetectorContext(const DetectionConfig& config,
                    std::unique_ptr<FrameClassifier> classifier,
                    std::unique_ptr<FaceLocator> face_locator);

    ~DetectorContext() = default;

    DetectorContext(const DetectorContext&) = delete;
    DetectorContext& operator=(const DetectorContext&) = delete;

    // Loads the ONNX classifier, the Haar cascade and the optional dlib shape predictor
    bool initialize(const std::string& models_path);

    bool isReady() const;

    const DetectionConfig& config() const { return config_; }
    FrameClassifier& classifier() { return *classifier_; }
    FaceLocator& faceLocator() { return *face_locator_; }
    const probes::ProbeSet& probes() const { return *probes_; }
    const RegionExtractor& extractor() const { return extractor_; }

    std::string modelVersion() const;

private:
    DetectionConfig config_;
    std::unique_ptr<FrameClassifier> classifier_;
    std::unique_ptr<FaceLocator> face_locator_;
    std::unique_ptr<probes::ProbeSet> probes_;
    RegionExtractor extractor_;

    static std::shared_ptr<const dlib::shape_predictor> loadShapePredictor(const std::string& models_path);

    static constexpr const char* SHAPE_PREDICTOR_FILE = "shape_predictor_68_face_landmarks.dat";
};

#endif // DETECTOR_CONTEXT_HPP
