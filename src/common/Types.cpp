#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace marketlens {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(Trend trend) {
    switch (trend) {
        case Trend::BULLISH: return "bullish";
        case Trend::BEARISH: return "bearish";
        case Trend::SIDEWAYS: return "sideways";
        case Trend::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string toString(VolatilityLevel level) {
    switch (level) {
        case VolatilityLevel::LOW: return "low";
        case VolatilityLevel::MODERATE: return "moderate";
        case VolatilityLevel::HIGH: return "high";
        case VolatilityLevel::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string toString(Action action) {
    switch (action) {
        case Action::BUY: return "BUY";
        case Action::SELL: return "SELL";
        case Action::HOLD: return "HOLD";
    }
    return "HOLD";
}

std::string toString(RiskAdjustedAction action) {
    switch (action) {
        case RiskAdjustedAction::STRONG_BUY: return "STRONG_BUY";
        case RiskAdjustedAction::BUY: return "BUY";
        case RiskAdjustedAction::CAUTIOUS_BUY: return "CAUTIOUS_BUY";
        case RiskAdjustedAction::HOLD: return "HOLD";
        case RiskAdjustedAction::SELL: return "SELL";
        case RiskAdjustedAction::STRONG_SELL: return "STRONG_SELL";
    }
    return "HOLD";
}

std::string toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL_MARKET: return "bull_market";
        case MarketRegime::BEAR_MARKET: return "bear_market";
        case MarketRegime::RANGE_BOUND: return "range_bound";
        case MarketRegime::TRANSITIONAL: return "transitional";
        case MarketRegime::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string toString(Sentiment sentiment) {
    switch (sentiment) {
        case Sentiment::BULLISH: return "bullish";
        case Sentiment::BEARISH: return "bearish";
        case Sentiment::NEUTRAL: return "neutral";
        case Sentiment::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::string toString(RelativeStrength strength) {
    switch (strength) {
        case RelativeStrength::OUTPERFORMING: return "outperforming";
        case RelativeStrength::UNDERPERFORMING: return "underperforming";
        case RelativeStrength::NEUTRAL: return "neutral";
    }
    return "neutral";
}

std::string toString(Direction direction) {
    return direction == Direction::BULLISH ? "bullish" : "bearish";
}

std::string toString(ZoneType type) {
    return type == ZoneType::DEMAND ? "demand" : "supply";
}

std::string toString(AnchorType type) {
    return type == AnchorType::HIGH ? "high" : "low";
}

Trend trendFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "bullish") return Trend::BULLISH;
    if (v == "bearish") return Trend::BEARISH;
    if (v == "sideways") return Trend::SIDEWAYS;
    return Trend::UNKNOWN;
}

VolatilityLevel volatilityFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "low") return VolatilityLevel::LOW;
    if (v == "moderate") return VolatilityLevel::MODERATE;
    if (v == "high") return VolatilityLevel::HIGH;
    return VolatilityLevel::UNKNOWN;
}

Sentiment sentimentFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "bullish") return Sentiment::BULLISH;
    if (v == "bearish") return Sentiment::BEARISH;
    if (v == "neutral") return Sentiment::NEUTRAL;
    return Sentiment::UNKNOWN;
}

} // namespace marketlens
