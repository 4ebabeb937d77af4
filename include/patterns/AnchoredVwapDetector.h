#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Anchored VWAP - VWAP of typical price from each of the last 3 local extrema
// (centered 10-candle rolling high/low) forward to the latest candle.
class AnchoredVwapDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 50;
    static constexpr int kExtremumWindow = 10;
    static constexpr size_t kEdgeSkip = 10;

    std::string name() const override { return "anchored_vwap"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::AnchoredVWAP> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
