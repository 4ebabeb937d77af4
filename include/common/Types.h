#pragma once

#include <string>
#include <vector>
#include <optional>

namespace marketlens {

using Price = double;
using Volume = double;
using TimestampMs = long long;

enum class Trend { BULLISH, BEARISH, SIDEWAYS, UNKNOWN };
enum class VolatilityLevel { LOW, MODERATE, HIGH, UNKNOWN };
enum class Action { BUY, SELL, HOLD };
enum class RiskAdjustedAction { STRONG_BUY, BUY, CAUTIOUS_BUY, HOLD, SELL, STRONG_SELL };
enum class MarketRegime { BULL_MARKET, BEAR_MARKET, RANGE_BOUND, TRANSITIONAL, UNKNOWN };
enum class Sentiment { BULLISH, BEARISH, NEUTRAL, UNKNOWN };
enum class RelativeStrength { OUTPERFORMING, UNDERPERFORMING, NEUTRAL };

// Pattern tags
enum class Direction { BULLISH, BEARISH };
enum class ZoneType { DEMAND, SUPPLY };
enum class AnchorType { HIGH, LOW };

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Wire names
std::string toString(Trend trend);
std::string toString(VolatilityLevel level);
std::string toString(Action action);
std::string toString(RiskAdjustedAction action);
std::string toString(MarketRegime regime);
std::string toString(Sentiment sentiment);
std::string toString(RelativeStrength strength);
std::string toString(Direction direction);
std::string toString(ZoneType type);
std::string toString(AnchorType type);

// Unrecognized names map to the UNKNOWN member.
Trend trendFromString(const std::string& value);
VolatilityLevel volatilityFromString(const std::string& value);
Sentiment sentimentFromString(const std::string& value);

} // namespace marketlens
