#include "patterns/RsiDivergenceDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <optional>

namespace marketlens {
namespace patterns {

using analytics::TechnicalIndicators;

namespace {
// Nearest j in [max(0, i - lookback), i - separation) satisfying is_extreme(j)
template<typename Pred>
std::optional<size_t> findPriorExtreme(size_t i, size_t lookback, size_t separation, Pred is_extreme) {
    if (i < separation + 1) {
        return std::nullopt;
    }
    const size_t first = i > lookback ? i - lookback : 0;
    for (size_t j = i - separation; j-- > first;) {
        if (is_extreme(j)) {
            return j;
        }
    }
    return std::nullopt;
}
}

void RsiDivergenceDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.rsi_divergence = detect(series);
}

std::vector<analytics::RSIDivergence> RsiDivergenceDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::RSIDivergence> divergences;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return divergences;
    }

    const auto& highs = series.highs();
    const auto& lows = series.lows();
    const auto& rsi = series.rsi14();

    const auto price_highs = TechnicalIndicators::rollingMaxCentered(highs, kExtremumWindow);
    const auto price_lows = TechnicalIndicators::rollingMinCentered(lows, kExtremumWindow);
    const auto rsi_highs = TechnicalIndicators::rollingMaxCentered(rsi, kExtremumWindow);
    const auto rsi_lows = TechnicalIndicators::rollingMinCentered(rsi, kExtremumWindow);

    // NaN never compares equal, so undefined windows are never extremes
    auto is_low_extreme = [&](size_t k) {
        return lows[k] == price_lows[k] && rsi[k] == rsi_lows[k];
    };
    auto is_high_extreme = [&](size_t k) {
        return highs[k] == price_highs[k] && rsi[k] == rsi_highs[k];
    };

    for (size_t i = kRsiPeriod + 10; i + kTrailingSkip < n; ++i) {
        if (is_low_extreme(i)) {
            auto j = findPriorExtreme(i, kLookback, kMinSeparation, is_low_extreme);
            if (j && lows[i] < lows[*j] && rsi[i] > rsi[*j]) {
                analytics::RSIDivergence div;
                div.type = Direction::BULLISH;
                div.rsi_value = rsi[i];
                div.strength = (rsi[i] - rsi[*j]) * 2.0;
                div.timestamp = series[i].timestamp;
                divergences.push_back(div);
            }
        }

        if (is_high_extreme(i)) {
            auto j = findPriorExtreme(i, kLookback, kMinSeparation, is_high_extreme);
            if (j && highs[i] > highs[*j] && rsi[i] < rsi[*j]) {
                analytics::RSIDivergence div;
                div.type = Direction::BEARISH;
                div.rsi_value = rsi[i];
                div.strength = (rsi[*j] - rsi[i]) * 2.0;
                div.timestamp = series[i].timestamp;
                divergences.push_back(div);
            }
        }
    }

    keepMostRecent(divergences, analytics::PatternSet::kMaxRsiDivergences);
    return divergences;
}

} // namespace patterns
} // namespace marketlens
