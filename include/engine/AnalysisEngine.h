#pragma once

#include "analytics/AnalysisTypes.h"
#include "analytics/CandleSeries.h"
#include "analytics/IntelligentScorer.h"
#include "analytics/RecommendationSynthesizer.h"
#include "analytics/RegimeDetector.h"
#include "engine/AnalysisConfig.h"
#include <optional>
#include <vector>

namespace marketlens {
namespace engine {

// One-shot pipeline: classify + detect (parallel) -> synthesize -> compare -> score.
// Holds no per-call state, so one engine can serve concurrent analyze() calls.
class AnalysisEngine {
public:
    explicit AnalysisEngine(const AnalysisConfig& config = AnalysisConfig());

    analytics::IntelligentAssessment analyze(
        const analytics::CandleSeries& series,
        const std::optional<analytics::MarketContext>& context = std::nullopt,
        const analytics::CandleSeries* companion = nullptr
    ) const;

    // Context snapshot from reference instruments (e.g. BTC then ETH), classified here
    analytics::MarketContext buildMarketContext(const std::vector<analytics::CandleSeries>& references) const;

    const AnalysisConfig& config() const { return config_; }

private:
    analytics::PatternSet detectPatterns(const analytics::CandleSeries& series,
                                         analytics::MarketAssessment& assessment) const;

    AnalysisConfig config_;
    analytics::RecommendationSynthesizer synthesizer_;
    analytics::IntelligentScorer scorer_;
    analytics::RegimeDetector regime_detector_;
};

} // namespace engine
} // namespace marketlens
