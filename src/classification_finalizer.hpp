#ifndef CLASSIFICATION_FINALIZER_HPP
#define CLASSIFICATION_FINALIZER_HPP

#include "media_types.hpp"
#include "detection_config.hpp"

struct Verdict {
    Classification classification = Classification::REAL;
    double confidence = 0.0;
};

// fake > fake_threshold is FAKE, fake > suspicious_threshold is SUSPICIOUS, otherwise REAL
class ClassificationFinalizer {
public:
    ClassificationFinalizer(double fake_threshold, double suspicious_threshold);
    explicit ClassificationFinalizer(const DetectionConfig& config);

    Classification classify(double fake_score) const;

    // Confidence is the fake score for FAKE/SUSPICIOUS and the real score for REAL
    Verdict finalize(const AggregateScores& scores) const;

private:
    double fake_threshold_;
    double suspicious_threshold_;
};

#endif // CLASSIFICATION_FINALIZER_HPP
