#pragma once

#include "analytics/AnalysisTypes.h"
#include "analytics/CandleSeries.h"

namespace marketlens {
namespace analytics {

// EMA-stack trend + ATR volatility + heuristic base confidence
class TrendClassifier {
public:
    static constexpr size_t kMinTrendCandles = 50;
    static constexpr size_t kMinVolatilityCandles = 14;

    static constexpr double kHighVolatilityPct = 5.0;      // ATR / close > 5% => high
    static constexpr double kModerateVolatilityPct = 2.0;  // > 2% => moderate

    static constexpr double kVolumeBoost = 20.0;
    static constexpr double kRsiBoost = 25.0;
    static constexpr double kTrendBoost = 30.0;
    static constexpr double kDefaultConfidence = 50.0;

    static MarketAssessment classify(const CandleSeries& series);

    // bullish iff close > EMA9 > EMA21 > EMA50 on the last candle (strict); bearish the reverse
    static Trend determineTrend(const CandleSeries& series);
    static VolatilityLevel determineVolatility(const CandleSeries& series);

    // Sum of independent boosts; kDefaultConfidence when none applies
    static double calculateConfidence(const CandleSeries& series, Trend trend);

    static VolatilityIndicators volatilityIndicators(const CandleSeries& series, VolatilityLevel level);
};

} // namespace analytics
} // namespace marketlens
