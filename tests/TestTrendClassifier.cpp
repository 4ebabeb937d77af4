#include "analytics/TrendClassifier.h"
#include "TestCandles.h"

#include <cassert>
#include <iostream>

using namespace marketlens;
using marketlens::analytics::TrendClassifier;

int main() {
    // Monotonic uptrend: strict EMA stack, low volatility, only the trend boost applies
    {
        auto series = testing::makeSeries(testing::uptrendCandles(60));
        auto result = TrendClassifier::classify(series);
        assert(result.trend == Trend::BULLISH);
        assert(result.volatility == VolatilityLevel::LOW);
        assert(result.confidence == 30.0);

        const size_t last = series.size() - 1;
        assert(series.closes()[last] > series.ema9()[last]);
        assert(series.ema9()[last] > series.ema21()[last]);
        assert(series.ema21()[last] > series.ema50()[last]);
    }

    // Downtrend with a 3.7% ATR
    {
        auto series = testing::makeSeries(testing::downtrendCandles(60));
        auto result = TrendClassifier::classify(series);
        assert(result.trend == Trend::BEARISH);
        assert(result.volatility == VolatilityLevel::MODERATE);
        assert(result.confidence == 30.0);
    }

    // Oscillation: sideways, RSI near 50 gives the momentum boost
    {
        auto series = testing::makeSeries(testing::flatCandles(60));
        auto result = TrendClassifier::classify(series);
        assert(result.trend == Trend::SIDEWAYS);
        assert(result.volatility == VolatilityLevel::LOW);
        assert(result.confidence == 25.0);
    }

    // High volatility: ATR above 5% of close
    {
        std::vector<double> closes;
        for (int i = 0; i < 30; ++i) {
            closes.push_back(i % 2 == 0 ? 100.0 : 112.0);
        }
        auto series = testing::makeSeries(testing::candlesFromCloses(closes));
        assert(TrendClassifier::determineVolatility(series) == VolatilityLevel::HIGH);
    }

    // Length boundaries
    {
        auto short13 = testing::makeSeries(testing::uptrendCandles(13));
        assert(TrendClassifier::determineVolatility(short13) == VolatilityLevel::UNKNOWN);
        assert(TrendClassifier::determineTrend(short13) == Trend::UNKNOWN);

        auto short14 = testing::makeSeries(testing::uptrendCandles(14));
        assert(TrendClassifier::determineVolatility(short14) == VolatilityLevel::LOW);

        // RSI-14 is defined from the 14th candle, so the momentum boost applies
        auto flat14 = testing::makeSeries(testing::flatCandles(14));
        assert(TrendClassifier::calculateConfidence(flat14, Trend::UNKNOWN) == 25.0);
        auto flat13 = testing::makeSeries(testing::flatCandles(13));
        assert(TrendClassifier::calculateConfidence(flat13, Trend::UNKNOWN) == 50.0);

        auto short49 = testing::makeSeries(testing::uptrendCandles(49));
        assert(TrendClassifier::determineTrend(short49) == Trend::UNKNOWN);
        auto exact50 = testing::makeSeries(testing::uptrendCandles(50));
        assert(TrendClassifier::determineTrend(exact50) == Trend::BULLISH);
    }

    // Empty input degrades, never throws
    {
        auto empty = testing::makeSeries({});
        auto result = TrendClassifier::classify(empty);
        assert(result.trend == Trend::UNKNOWN);
        assert(result.volatility == VolatilityLevel::UNKNOWN);
        assert(result.confidence == 50.0);

        auto indicators = TrendClassifier::volatilityIndicators(empty, result.volatility);
        assert(!indicators.average_true_range.has_value());
        assert(!indicators.bollinger_bands_width.has_value());
    }

    // Volume spike on the last candle adds the volume boost
    {
        auto candles = testing::uptrendCandles(60);
        candles.back().volume = 5000.0;
        auto result = TrendClassifier::classify(testing::makeSeries(candles));
        assert(result.confidence == 50.0);   // 20 volume + 30 trend
    }

    // Indicators mirror the last defined values
    {
        auto series = testing::makeSeries(testing::uptrendCandles(60));
        auto indicators = TrendClassifier::volatilityIndicators(series, VolatilityLevel::LOW);
        assert(indicators.average_true_range.has_value());
        assert(testing::near(*indicators.average_true_range, 1.5));
        assert(indicators.bollinger_bands_width.has_value());
        assert(*indicators.bollinger_bands_width > 0.0);
        assert(indicators.volatility_level == VolatilityLevel::LOW);
    }

    std::cout << "[TEST] TrendClassifier PASSED\n";
    return 0;
}
