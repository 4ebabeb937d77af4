#pragma once

#include <vector>
#include <optional>
#include <cstddef>
#include "common/Types.h"

namespace marketlens {
namespace analytics {

// Technical Indicators - full-length series aligned with the input.
// Positions that are not yet defined (window not filled) hold NaN.
class TechnicalIndicators {
public:
    // EMA with bias-corrected weights from the first sample (alpha = 2 / (span + 1)).
    // Defined from index 0.
    static std::vector<double> calculateEMASeries(const std::vector<double>& values, int span);

    // Trailing window ending at i (inclusive)
    static std::vector<double> rollingMean(const std::vector<double>& values, int window);
    static std::vector<double> rollingStd(const std::vector<double>& values, int window);  // sample std

    // Centered window [i - window/2, i + (window-1)/2]
    static std::vector<double> rollingMaxCentered(const std::vector<double>& values, int window);
    static std::vector<double> rollingMinCentered(const std::vector<double>& values, int window);

    // True range; the first candle has no previous close and uses high - low.
    static std::vector<double> calculateTrueRange(const std::vector<Candle>& candles);

    // ATR: rolling mean of true range. Defined from index period-1.
    static std::vector<double> calculateATRSeries(const std::vector<Candle>& candles, int period = 14);

    // RSI from rolling-mean gains/losses over `period` deltas, the first one taken as zero.
    // Defined from index period - 1.
    // 70+ overbought, 30- oversold. No losses => 100, no movement at all => 50.
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    // Bollinger band width as % of the middle band
    static std::vector<double> calculateBollingerWidthSeries(const std::vector<double>& prices,
                                                             int period = 20,
                                                             double std_dev_mult = 2.0);

    // VWAP of typical price from candles[begin] to the end; nullopt without volume.
    static std::optional<double> calculateVWAP(const std::vector<Candle>& candles, size_t begin = 0);

    // Pearson correlation in [-1, 1]; 0.0 when undefined (size < 2, size mismatch, zero variance).
    static double pearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b);

    // Column extraction
    static std::vector<double> extractOpenPrices(const std::vector<Candle>& candles);
    static std::vector<double> extractHighPrices(const std::vector<Candle>& candles);
    static std::vector<double> extractLowPrices(const std::vector<Candle>& candles);
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);

    static bool isDefined(double value);

private:
    static double calculateMean(const std::vector<double>& values, size_t begin, size_t end);
    static double calculateStandardDeviation(const std::vector<double>& values,
                                             size_t begin, size_t end, double mean);
    static bool windowDefined(const std::vector<double>& values, size_t begin, size_t end);
};

} // namespace analytics
} // namespace marketlens
