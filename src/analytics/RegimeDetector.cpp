#include "analytics/RegimeDetector.h"

namespace marketlens {
namespace analytics {

VolatilityLevel RegimeDetector::effectiveVolatility(const MarketContext& context) {
    // Unknown market-wide volatility reads as moderate
    if (context.overall_volatility == VolatilityLevel::UNKNOWN) {
        return VolatilityLevel::MODERATE;
    }
    return context.overall_volatility;
}

MarketRegime RegimeDetector::determineRegime(const std::optional<MarketContext>& context) const {
    if (!context) {
        return MarketRegime::UNKNOWN;
    }

    const Trend trend = context->reference_trend;
    const VolatilityLevel volatility = effectiveVolatility(*context);

    if (trend == Trend::BULLISH &&
        (volatility == VolatilityLevel::LOW || volatility == VolatilityLevel::MODERATE)) {
        return MarketRegime::BULL_MARKET;
    }
    if (trend == Trend::BEARISH && volatility == VolatilityLevel::HIGH) {
        return MarketRegime::BEAR_MARKET;
    }
    if (trend == Trend::SIDEWAYS || context->market_sentiment == Sentiment::NEUTRAL) {
        return MarketRegime::RANGE_BOUND;
    }
    return MarketRegime::TRANSITIONAL;
}

RiskAdjustedAction RegimeDetector::passThrough(Action action) {
    switch (action) {
        case Action::BUY: return RiskAdjustedAction::BUY;
        case Action::SELL: return RiskAdjustedAction::SELL;
        case Action::HOLD: return RiskAdjustedAction::HOLD;
    }
    return RiskAdjustedAction::HOLD;
}

RiskAdjustedAction RegimeDetector::adjustForRisk(
    Action action,
    MarketRegime regime,
    const std::optional<MarketContext>& context
) const {
    if (!context) {
        return passThrough(action);
    }

    if (effectiveVolatility(*context) == VolatilityLevel::HIGH) {
        if (action == Action::BUY) return RiskAdjustedAction::CAUTIOUS_BUY;
        if (action == Action::SELL) return RiskAdjustedAction::STRONG_SELL;
    } else if (regime == MarketRegime::BULL_MARKET && action == Action::BUY) {
        return RiskAdjustedAction::STRONG_BUY;
    } else if (regime == MarketRegime::BEAR_MARKET && action == Action::SELL) {
        return RiskAdjustedAction::STRONG_SELL;
    }

    return passThrough(action);
}

} // namespace analytics
} // namespace marketlens
