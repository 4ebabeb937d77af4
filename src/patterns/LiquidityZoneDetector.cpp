#include "patterns/LiquidityZoneDetector.h"
#include "analytics/TechnicalIndicators.h"

namespace marketlens {
namespace patterns {

using analytics::TechnicalIndicators;

void LiquidityZoneDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.liquidity_zones = detect(series);
}

std::vector<analytics::LiquidityZone> LiquidityZoneDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::LiquidityZone> zones;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return zones;
    }

    const auto& volumes = series.volumes();
    const auto volume_mean = TechnicalIndicators::rollingMean(volumes, kVolumeWindow);

    for (size_t i = kVolumeWindow; i < n; ++i) {
        if (!TechnicalIndicators::isDefined(volume_mean[i])) continue;
        if (volumes[i] <= volume_mean[i] * kVolumeMultiplier) continue;

        const auto& candle = series[i];
        analytics::LiquidityZone zone;
        zone.upper_level = candle.high;
        zone.lower_level = candle.low;
        zone.volume = candle.volume;
        zone.type = candle.close > candle.open ? ZoneType::DEMAND : ZoneType::SUPPLY;
        zone.timestamp = candle.timestamp;
        zones.push_back(zone);
    }

    keepMostRecent(zones, analytics::PatternSet::kMaxLiquidityZones);
    return zones;
}

} // namespace patterns
} // namespace marketlens
