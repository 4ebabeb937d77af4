#include "patterns/OrderBlockDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace marketlens {
namespace patterns {

using analytics::TechnicalIndicators;

void OrderBlockDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.order_blocks = detect(series);
}

std::vector<analytics::OrderBlock> OrderBlockDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::OrderBlock> blocks;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return blocks;
    }

    const auto& volumes = series.volumes();
    const auto& highs = series.highs();
    const auto& lows = series.lows();
    const auto& volume_mean = series.volumeSma20();
    const auto volume_std = TechnicalIndicators::rollingStd(volumes, kVolumeWindow);

    for (size_t i = kVolumeWindow; i + kTrailingSkip < n; ++i) {
        if (!TechnicalIndicators::isDefined(volume_mean[i]) || !TechnicalIndicators::isDefined(volume_std[i])) {
            continue;
        }
        const double volume_threshold = volume_mean[i] + 2.0 * volume_std[i];
        if (volumes[i] <= volume_threshold) {
            continue;
        }

        double high_sum = 0.0;
        double low_sum = 0.0;
        for (size_t k = i - kRangeWindow; k < i; ++k) {
            high_sum += highs[k];
            low_sum += lows[k];
        }
        const double avg_range = (high_sum - low_sum) / kRangeWindow;
        if (avg_range <= 0.0) {
            continue;
        }

        const auto& candle = series[i];
        const double price_change = std::abs(candle.close - candle.open);
        if (price_change > avg_range * 0.5) {
            analytics::OrderBlock block;
            block.level = candle.close;
            block.type = candle.close > candle.open ? ZoneType::DEMAND : ZoneType::SUPPLY;
            block.strength = std::min(price_change / avg_range * 50.0, 100.0);
            block.timestamp = candle.timestamp;
            blocks.push_back(block);
        }
    }

    keepMostRecent(blocks, analytics::PatternSet::kMaxOrderBlocks);
    return blocks;
}

} // namespace patterns
} // namespace marketlens
