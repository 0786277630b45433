#ifndef DEEPFAKE_ANALYZER_HPP
#define DEEPFAKE_ANALYZER_HPP

#include "detector_context.hpp"
#include "frame_set_builder.hpp"
#include "score_aggregator.hpp"
#include "classification_finalizer.hpp"
#include "video_consistency.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>

using json = nlohmann::json;

struct AnalysisResult {
    AggregateScores scores;
    Classification classification = Classification::REAL;
    double confidence = 0.0;
    AnalysisDetails details;

    json toJson() const;
};

// One classification call: faces, regions, probes, batch classifier, aggregation, verdict.
// Throws MediaDecodeError or ClassifierError; probe failures only show up in the details.
class DeepfakeAnalyzer {
public:
    explicit DeepfakeAnalyzer(DetectorContext& context);

    AnalysisResult analyze(const DecodedMedia& media);

private:
    DetectorContext& context_;
    FrameSetBuilder builder_;
    ScoreAggregator aggregator_;
    ClassificationFinalizer finalizer_;
    VideoConsistencyAnalyzer video_analyzer_;

    AggregationContext analyzeImage(const DecodedMedia& media);
    AggregationContext analyzeVideo(const DecodedMedia& media);

    std::vector<FaceRegion> extractFaceRegions(const cv::Mat& image, const std::vector<FaceInfo>& faces) const;

    // Runs the probes concurrently on one input and joins before returning
    std::map<std::string, probes::ProbeResult> runProbes(const std::vector<const probes::Probe*>& probe_list,
                                                         const probes::ProbeInput& input) const;

    // Face-level probe on every face, keeping the most suspicious result
    probes::ProbeResult runPerFace(const probes::Probe& probe, const cv::Mat& image,
                                   const std::vector<FaceRegion>& regions,
                                   const std::vector<unsigned char>* raw_bytes) const;

    void scoreFrames(const std::vector<AnalysisFrame>& frames, AggregationContext& aggregation);
};

#endif // DEEPFAKE_ANALYZER_HPP
