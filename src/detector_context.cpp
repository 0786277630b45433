#include "detector_context.hpp"
#include <dlib/serialize.h>
#include <filesystem>
#include <iostream>

DetectorContext::DetectorContext(const DetectionConfig& config)
    : config_(config),
      face_locator_(std::make_unique<FaceLocator>(config)),
      probes_(std::make_unique<probes::ProbeSet>()),
      extractor_(config) {
    probes_->configure(config_);
}

DetectorContext::DetectorContext(const DetectionConfig& config,
                                 std::unique_ptr<FrameClassifier> classifier,
                                 std::unique_ptr<FaceLocator> face_locator)
    : config_(config),
      classifier_(std::move(classifier)),
      face_locator_(std::move(face_locator)),
      probes_(std::make_unique<probes::ProbeSet>()),
      extractor_(config) {
    probes_->configure(config_);
}

std::shared_ptr<const dlib::shape_predictor> DetectorContext::loadShapePredictor(const std::string& models_path) {
    std::filesystem::path path = std::filesystem::path(models_path) / SHAPE_PREDICTOR_FILE;
    if (!std::filesystem::exists(path)) {
        std::cout << "Shape predictor not found at " << path << ", landmark geometry disabled" << std::endl;
        return nullptr;
    }

    try {
        auto predictor = std::make_shared<dlib::shape_predictor>();
        dlib::deserialize(path.string()) >> *predictor;
        std::cout << "Shape predictor loaded: " << path << std::endl;
        return predictor;
    } catch (const std::exception& e) {
        std::cerr << "Error loading shape predictor: " << e.what() << std::endl;
        return nullptr;
    }
}

bool DetectorContext::initialize(const std::string& models_path) {
    std::cout << "Loading detection models from " << models_path << "..." << std::endl;

    auto classifier = std::make_unique<DnnFrameClassifier>();
    if (!classifier->initialize(models_path)) {
        std::cerr << "Failed to load frame classifier" << std::endl;
        return false;
    }
    classifier_ = std::move(classifier);

    if (!face_locator_->initialize(models_path)) {
        std::cerr << "Failed to load face detector cascade" << std::endl;
        return false;
    }

    probes_ = std::make_unique<probes::ProbeSet>(loadShapePredictor(models_path));
    probes_->configure(config_);

    std::cout << "Detector context ready (model " << modelVersion() << ")" << std::endl;
    return true;
}

bool DetectorContext::isReady() const {
    return classifier_ && classifier_->isLoaded() && face_locator_ && probes_;
}

std::string DetectorContext::modelVersion() const {
    return classifier_ ? classifier_->modelVersion() : "none";
}
