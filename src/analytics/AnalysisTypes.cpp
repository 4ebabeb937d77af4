#include "analytics/AnalysisTypes.h"

namespace marketlens {
namespace analytics {

MarketContext MarketContext::fromReferences(const std::vector<MarketAssessment>& references) {
    MarketContext context;
    if (references.empty()) {
        return context;
    }

    int bullish_count = 0;
    int bearish_count = 0;
    int high_count = 0;
    int low_count = 0;
    for (const auto& ref : references) {
        if (ref.trend == Trend::BULLISH) ++bullish_count;
        else if (ref.trend == Trend::BEARISH) ++bearish_count;

        if (ref.volatility == VolatilityLevel::HIGH) ++high_count;
        else if (ref.volatility == VolatilityLevel::LOW) ++low_count;
    }

    if (bullish_count > bearish_count) {
        context.market_sentiment = Sentiment::BULLISH;
    } else if (bearish_count > bullish_count) {
        context.market_sentiment = Sentiment::BEARISH;
    } else {
        context.market_sentiment = Sentiment::NEUTRAL;
    }

    context.reference_trend = references.front().trend;

    if (high_count > low_count) {
        context.overall_volatility = VolatilityLevel::HIGH;
    } else if (low_count > high_count) {
        context.overall_volatility = VolatilityLevel::LOW;
    } else {
        context.overall_volatility = VolatilityLevel::MODERATE;
    }

    return context;
}

} // namespace analytics
} // namespace marketlens
