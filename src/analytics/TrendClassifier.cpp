#include "analytics/TrendClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>

namespace marketlens {
namespace analytics {

MarketAssessment TrendClassifier::classify(const CandleSeries& series) {
    MarketAssessment result;
    result.trend = determineTrend(series);
    result.volatility = determineVolatility(series);
    result.confidence = calculateConfidence(series, result.trend);
    return result;
}

Trend TrendClassifier::determineTrend(const CandleSeries& series) {
    if (series.size() < kMinTrendCandles) {
        return Trend::UNKNOWN;
    }

    const size_t last = series.size() - 1;
    const double price = series.closes()[last];
    const double ema9 = series.ema9()[last];
    const double ema21 = series.ema21()[last];
    const double ema50 = series.ema50()[last];

    if (price > ema9 && ema9 > ema21 && ema21 > ema50) {
        return Trend::BULLISH;
    }
    if (price < ema9 && ema9 < ema21 && ema21 < ema50) {
        return Trend::BEARISH;
    }
    return Trend::SIDEWAYS;
}

VolatilityLevel TrendClassifier::determineVolatility(const CandleSeries& series) {
    if (series.size() < kMinVolatilityCandles) {
        return VolatilityLevel::UNKNOWN;
    }

    const double atr = series.atr14().back();
    const double price = series.back().close;
    if (!TechnicalIndicators::isDefined(atr)) {
        return VolatilityLevel::UNKNOWN;
    }

    const double atr_pct = (atr / price) * 100.0;
    if (atr_pct > kHighVolatilityPct) return VolatilityLevel::HIGH;
    if (atr_pct > kModerateVolatilityPct) return VolatilityLevel::MODERATE;
    return VolatilityLevel::LOW;
}

double TrendClassifier::calculateConfidence(const CandleSeries& series, Trend trend) {
    double confidence = 0.0;
    bool boosted = false;

    // Volume above its 20-period mean
    if (!series.empty()) {
        const double volume_sma = series.volumeSma20().back();
        if (TechnicalIndicators::isDefined(volume_sma) && series.back().volume > volume_sma) {
            confidence += kVolumeBoost;
            boosted = true;
        }
    }

    // Momentum not overbought/oversold
    if (!series.empty()) {
        const double rsi = series.rsi14().back();
        if (TechnicalIndicators::isDefined(rsi) && rsi >= 30.0 && rsi <= 70.0) {
            confidence += kRsiBoost;
            boosted = true;
        }
    }

    if (trend == Trend::BULLISH || trend == Trend::BEARISH) {
        confidence += kTrendBoost;
        boosted = true;
    }

    if (!boosted) {
        return kDefaultConfidence;
    }
    return std::clamp(confidence, 0.0, 100.0);
}

VolatilityIndicators TrendClassifier::volatilityIndicators(const CandleSeries& series, VolatilityLevel level) {
    VolatilityIndicators result;
    result.volatility_level = level;
    if (series.empty()) {
        return result;
    }

    const double width = series.bollingerWidth20().back();
    if (TechnicalIndicators::isDefined(width)) {
        result.bollinger_bands_width = width;
    }
    const double atr = series.atr14().back();
    if (TechnicalIndicators::isDefined(atr)) {
        result.average_true_range = atr;
    }
    return result;
}

} // namespace analytics
} // namespace marketlens
