#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// RSI Divergence - price and RSI-14 extremes disagree.
// Lower price low + higher RSI low => bullish; higher price high + lower RSI high => bearish.
// An extreme is a candle matching the centered 5-candle rolling extreme of both price and RSI;
// it is compared to the nearest prior extreme of the same kind 6..20 candles back.
class RsiDivergenceDetector : public IPatternDetector {
public:
    static constexpr int kRsiPeriod = 14;
    static constexpr size_t kMinCandles = kRsiPeriod * 3;
    static constexpr int kExtremumWindow = 5;
    static constexpr size_t kLookback = 20;
    static constexpr size_t kMinSeparation = 5;
    static constexpr size_t kTrailingSkip = 5;

    std::string name() const override { return "rsi_divergence"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::RSIDivergence> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
