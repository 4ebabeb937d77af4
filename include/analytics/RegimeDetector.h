#pragma once

#include "analytics/AnalysisTypes.h"
#include <optional>

namespace marketlens {
namespace analytics {

// Coarse market regime from the external context snapshot
class RegimeDetector {
public:
    RegimeDetector() = default;

    // reference bullish + low/moderate vol => bull_market
    // reference bearish + high vol         => bear_market
    // reference sideways or neutral mood   => range_bound
    // otherwise transitional; no context   => unknown
    MarketRegime determineRegime(const std::optional<MarketContext>& context) const;

    // High context volatility: BUY -> CAUTIOUS_BUY, SELL -> STRONG_SELL.
    // Otherwise bull_market: BUY -> STRONG_BUY, bear_market: SELL -> STRONG_SELL.
    RiskAdjustedAction adjustForRisk(Action action,
                                     MarketRegime regime,
                                     const std::optional<MarketContext>& context) const;

    static RiskAdjustedAction passThrough(Action action);

private:
    static VolatilityLevel effectiveVolatility(const MarketContext& context);
};

} // namespace analytics
} // namespace marketlens
