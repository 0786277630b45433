#include "classification_finalizer.hpp"

ClassificationFinalizer::ClassificationFinalizer(double fake_threshold, double suspicious_threshold)
    : fake_threshold_(fake_threshold), suspicious_threshold_(suspicious_threshold) {
}

ClassificationFinalizer::ClassificationFinalizer(const DetectionConfig& config)
    : ClassificationFinalizer(config.fake_threshold, config.suspicious_threshold) {
}

Classification ClassificationFinalizer::classify(double fake_score) const {
    if (fake_score > fake_threshold_) {
        return Classification::FAKE;
    }
    if (fake_score > suspicious_threshold_) {
        return Classification::SUSPICIOUS;
    }
    return Classification::REAL;
}

Verdict ClassificationFinalizer::finalize(const AggregateScores& scores) const {
    Verdict verdict;
    verdict.classification = classify(scores.fake);
    verdict.confidence = verdict.classification == Classification::REAL ? scores.real : scores.fake;
    return verdict;
}
