#pragma once

#include "analytics/AnalysisTypes.h"
#include "analytics/CandleSeries.h"
#include "engine/AnalysisConfig.h"

namespace marketlens {
namespace analytics {

// Fuses classifier + detector outputs into one action.
// total = trend(+1/-1/0) + volatility(-0.5 high / +0.5 low) + 0.5 per RSI divergence (signed)
//         + 0.3 per BOS (signed)
class RecommendationSynthesizer {
public:
    explicit RecommendationSynthesizer(const engine::AnalysisConfig& config);

    Recommendation synthesize(const CandleSeries& series,
                              const MarketAssessment& assessment,
                              const VolatilityIndicators& volatility,
                              const PatternSet& patterns) const;

    static double trendScore(Trend trend);
    static double volatilityScore(VolatilityLevel level);
    static double divergenceScore(const std::vector<RSIDivergence>& divergences);
    static double structureScore(const std::vector<BreakOfStructure>& breaks);

private:
    engine::AnalysisConfig config_;
};

} // namespace analytics
} // namespace marketlens
