#ifndef FRAME_CLASSIFIER_HPP
#define FRAME_CLASSIFIER_HPP

#include "media_types.hpp"
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include <mutex>
#include <string>
#include <vector>

// Pretrained two-class image classifier. One call scores the whole frame set.
class FrameClassifier {
public:
    virtual ~FrameClassifier() = default;

    virtual bool isLoaded() const = 0;
    virtual std::string modelVersion() const = 0;

    // One FrameScore per input image, in input order. Throws ClassifierError.
    virtual std::vector<FrameScore> classifyBatch(const std::vector<cv::Mat>& images) = 0;
};

// ONNX export of the deepfake classifier run through OpenCV DNN.
// Output index 0 is "fake", index 1 is "real".
class DnnFrameClassifier : public FrameClassifier {
public:
    DnnFrameClassifier();

    // Looks for deepfake_classifier.onnx in models_path
    bool initialize(const std::string& models_path);

    bool isLoaded() const override { return loaded_; }
    std::string modelVersion() const override { return model_version_; }

    std::vector<FrameScore> classifyBatch(const std::vector<cv::Mat>& images) override;

    // Numerically stable two-way softmax
    static FrameScore softmax(float fake_logit, float real_logit);

private:
    cv::dnn::Net net_;
    std::mutex net_mutex_;
    bool loaded_;
    std::string model_version_;

    static constexpr int INPUT_SIZE = 224;
    static constexpr double PIXEL_MEAN = 0.5;
    static constexpr double PIXEL_STD = 0.5;
    static constexpr size_t MAX_BATCH = 32;
    static constexpr const char* MODEL_FILE = "deepfake_classifier.onnx";
};

#endif // FRAME_CLASSIFIER_HPP
