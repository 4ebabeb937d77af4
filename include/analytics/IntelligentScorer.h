#pragma once

#include "analytics/AnalysisTypes.h"
#include "engine/AnalysisConfig.h"
#include <optional>

namespace marketlens {
namespace analytics {

// 0 ~ 100 score that weighs institutional structure (order blocks, FVG, BOS) aligned
// with the local trend, then averages with the recommendation confidence.
class IntelligentScorer {
public:
    static constexpr double kBaseScore = 50.0;

    explicit IntelligentScorer(const engine::ScoringWeights& weights);

    double score(const MarketAssessment& assessment,
                 const PatternSet& patterns,
                 const Recommendation& recommendation,
                 const std::optional<MarketContext>& context) const;

private:
    static bool alignedWith(ZoneType type, Trend trend);
    static bool alignedWith(Direction direction, Trend trend);

    engine::ScoringWeights weights_;
};

} // namespace analytics
} // namespace marketlens
