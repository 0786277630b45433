#ifndef SCORE_AGGREGATOR_HPP
#define SCORE_AGGREGATOR_HPP

#include "boost_stages.hpp"
#include <memory>
#include <vector>

struct AggregationResult {
    AggregateScores scores;
    AnalysisDetails details;
};

// Weighted frame vote followed by the ordered boost stages.
// Single-threaded: each stage reads the score the previous one produced.
class ScoreAggregator {
public:
    explicit ScoreAggregator(const DetectionConfig& config);
    ScoreAggregator(const DetectionConfig& config, std::vector<std::unique_ptr<BoostStage>> stages);

    AggregationResult aggregate(const AggregationContext& context) const;

    // Σ(fake·w)/Σw plus channel averages, per-face scores and the frame breakdown
    ScoreState weightedVote(const AggregationContext& context) const;

    const std::vector<std::unique_ptr<BoostStage>>& stages() const { return stages_; }

    static std::string contentType(int faces_detected);

private:
    DetectionConfig config_;
    std::vector<std::unique_ptr<BoostStage>> stages_;
    FinalClampStage fallback_clamp_;
};

#endif // SCORE_AGGREGATOR_HPP
