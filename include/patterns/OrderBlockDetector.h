#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Order Block - high-volume candle with an outsized body (institutional zone).
// Volume > mean20 + 2 std and |close - open| > 0.5 x average range of the prior 10 candles.
class OrderBlockDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 50;
    static constexpr int kVolumeWindow = 20;
    static constexpr int kRangeWindow = 10;
    static constexpr size_t kTrailingSkip = 5;    // last candles are not confirmed yet

    std::string name() const override { return "order_blocks"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::OrderBlock> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
