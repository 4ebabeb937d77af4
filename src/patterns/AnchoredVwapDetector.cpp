#include "patterns/AnchoredVwapDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <utility>

namespace marketlens {
namespace patterns {

using analytics::TechnicalIndicators;

void AnchoredVwapDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.anchored_vwap = detect(series);
}

std::vector<analytics::AnchoredVWAP> AnchoredVwapDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::AnchoredVWAP> vwaps;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return vwaps;
    }

    const auto& highs = series.highs();
    const auto& lows = series.lows();
    const auto rolling_highs = TechnicalIndicators::rollingMaxCentered(highs, kExtremumWindow);
    const auto rolling_lows = TechnicalIndicators::rollingMinCentered(lows, kExtremumWindow);

    // A candle that is both the local high and low anchors as a high
    std::vector<std::pair<size_t, AnchorType>> anchors;
    for (size_t i = kEdgeSkip; i + kEdgeSkip < n; ++i) {
        if (highs[i] == rolling_highs[i]) {
            anchors.emplace_back(i, AnchorType::HIGH);
        } else if (lows[i] == rolling_lows[i]) {
            anchors.emplace_back(i, AnchorType::LOW);
        }
    }
    keepMostRecent(anchors, analytics::PatternSet::kMaxAnchoredVwaps);

    for (const auto& [anchor_idx, anchor_type] : anchors) {
        auto vwap = TechnicalIndicators::calculateVWAP(series.candles(), anchor_idx);
        if (!vwap) {
            continue;
        }

        analytics::AnchoredVWAP entry;
        entry.anchor_point = anchor_type == AnchorType::HIGH ? highs[anchor_idx] : lows[anchor_idx];
        entry.current_vwap = *vwap;
        entry.anchor_type = anchor_type;
        entry.timestamp = series[anchor_idx].timestamp;
        vwaps.push_back(entry);
    }

    return vwaps;
}

} // namespace patterns
} // namespace marketlens
