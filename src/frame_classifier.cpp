#include "frame_classifier.hpp"
#include "fakescan_errors.hpp"
#include <filesystem>
#include <iostream>
#include <cmath>

DnnFrameClassifier::DnnFrameClassifier() : loaded_(false), model_version_("none") {
}

bool DnnFrameClassifier::initialize(const std::string& models_path) {
    std::filesystem::path model_path = std::filesystem::path(models_path) / MODEL_FILE;
    if (!std::filesystem::exists(model_path)) {
        std::cerr << "Frame classifier model not found at: " << model_path << std::endl;
        return false;
    }

    try {
        net_ = cv::dnn::readNetFromONNX(model_path.string());
        if (net_.empty()) {
            std::cerr << "Failed to load frame classifier: " << model_path << std::endl;
            return false;
        }
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

        model_version_ = model_path.stem().string();
        loaded_ = true;
        std::cout << "Frame classifier loaded: " << model_path << std::endl;
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV exception loading frame classifier: " << e.what() << std::endl;
        loaded_ = false;
        return false;
    }
}

FrameScore DnnFrameClassifier::softmax(float fake_logit, float real_logit) {
    float top = std::max(fake_logit, real_logit);
    double fake_exp = std::exp(static_cast<double>(fake_logit - top));
    double real_exp = std::exp(static_cast<double>(real_logit - top));
    double total = fake_exp + real_exp;

    FrameScore score;
    score.fake = static_cast<float>(fake_exp / total);
    score.real = 1.0f - score.fake;
    return score;
}

std::vector<FrameScore> DnnFrameClassifier::classifyBatch(const std::vector<cv::Mat>& images) {
    if (!loaded_) {
        throw ClassifierError("frame classifier not loaded");
    }

    std::vector<FrameScore> scores;
    scores.reserve(images.size());

    std::lock_guard<std::mutex> lock(net_mutex_);
    for (size_t start = 0; start < images.size(); start += MAX_BATCH) {
        size_t end = std::min(images.size(), start + MAX_BATCH);
        std::vector<cv::Mat> batch(images.begin() + start, images.begin() + end);

        try {
            // (x / 255 - 0.5) / 0.5 on RGB
            cv::Mat blob = cv::dnn::blobFromImages(batch, 1.0 / (255.0 * PIXEL_STD),
                                                   cv::Size(INPUT_SIZE, INPUT_SIZE),
                                                   cv::Scalar(255.0 * PIXEL_MEAN, 255.0 * PIXEL_MEAN, 255.0 * PIXEL_MEAN),
                                                   true, false);
            net_.setInput(blob);
            cv::Mat logits = net_.forward();
            logits = logits.reshape(1, static_cast<int>(batch.size()));

            if (logits.rows != static_cast<int>(batch.size()) || logits.cols < 2) {
                throw ClassifierError("unexpected classifier output shape");
            }
            for (int i = 0; i < logits.rows; ++i) {
                scores.push_back(softmax(logits.at<float>(i, 0), logits.at<float>(i, 1)));
            }
        } catch (const cv::Exception& e) {
            throw ClassifierError(std::string("classifier inference failed: ") + e.what());
        }
    }

    if (scores.size() != images.size()) {
        throw ClassifierError("classifier returned " + std::to_string(scores.size()) +
                              " scores for " + std::to_string(images.size()) + " frames");
    }
    return scores;
}
