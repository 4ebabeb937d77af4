#include "patterns/BreakOfStructureDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <limits>

namespace marketlens {
namespace patterns {

using analytics::TechnicalIndicators;

void BreakOfStructureDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.break_of_structure = detect(series);
}

std::vector<analytics::BreakOfStructure> BreakOfStructureDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::BreakOfStructure> breaks;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return breaks;
    }

    const auto swing_highs = TechnicalIndicators::rollingMaxCentered(series.highs(), kSwingWindow);
    const auto swing_lows = TechnicalIndicators::rollingMinCentered(series.lows(), kSwingWindow);

    for (size_t i = kLookback; i + kTrailingSkip < n; ++i) {
        // Undefined (edge) swing values are skipped; swings reaching candle i are not yet formed
        double recent_high = -std::numeric_limits<double>::infinity();
        double recent_low = std::numeric_limits<double>::infinity();
        for (size_t k = i - kLookback; k + kSwingLookahead < i; ++k) {
            if (TechnicalIndicators::isDefined(swing_highs[k]) && swing_highs[k] > recent_high) {
                recent_high = swing_highs[k];
            }
            if (TechnicalIndicators::isDefined(swing_lows[k]) && swing_lows[k] < recent_low) {
                recent_low = swing_lows[k];
            }
        }

        const auto& candle = series[i];

        if (recent_high > 0.0 && candle.close > recent_high) {
            analytics::BreakOfStructure bos;
            bos.level = recent_high;
            bos.direction = Direction::BULLISH;
            bos.strength = ((candle.close - recent_high) / recent_high) * 100.0;
            bos.timestamp = candle.timestamp;
            breaks.push_back(bos);
        }

        if (recent_low > 0.0 && recent_low != std::numeric_limits<double>::infinity() &&
            candle.close < recent_low) {
            analytics::BreakOfStructure bos;
            bos.level = recent_low;
            bos.direction = Direction::BEARISH;
            bos.strength = ((recent_low - candle.close) / recent_low) * 100.0;
            bos.timestamp = candle.timestamp;
            breaks.push_back(bos);
        }
    }

    keepMostRecent(breaks, analytics::PatternSet::kMaxBreaksOfStructure);
    return breaks;
}

} // namespace patterns
} // namespace marketlens
