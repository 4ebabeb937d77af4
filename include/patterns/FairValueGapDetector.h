#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Fair Value Gap - 3-candle imbalance.
// low[i] > high[i-2] => bullish gap [high[i-2], low[i]]
// high[i] < low[i-2] => bearish gap [high[i], low[i-2]]
class FairValueGapDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 3;

    std::string name() const override { return "fair_value_gaps"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::FairValueGap> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
