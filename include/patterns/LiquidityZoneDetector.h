#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Liquidity Zone - candle range where volume > 1.5 x its 10-period mean
class LiquidityZoneDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 20;
    static constexpr int kVolumeWindow = 10;
    static constexpr double kVolumeMultiplier = 1.5;

    std::string name() const override { return "liquidity_zones"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::LiquidityZone> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
