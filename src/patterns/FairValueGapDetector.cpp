#include "patterns/FairValueGapDetector.h"

namespace marketlens {
namespace patterns {

void FairValueGapDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.fair_value_gaps = detect(series);
}

std::vector<analytics::FairValueGap> FairValueGapDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::FairValueGap> gaps;
    if (series.size() < kMinCandles) {
        return gaps;
    }

    for (size_t i = 2; i < series.size(); ++i) {
        const auto& current = series[i];
        const auto& anchor = series[i - 2];

        if (current.low > anchor.high) {
            analytics::FairValueGap gap;
            gap.upper_level = current.low;
            gap.lower_level = anchor.high;
            gap.type = Direction::BULLISH;
            gap.timestamp = current.timestamp;
            gaps.push_back(gap);
        } else if (current.high < anchor.low) {
            analytics::FairValueGap gap;
            gap.upper_level = anchor.low;
            gap.lower_level = current.high;
            gap.type = Direction::BEARISH;
            gap.timestamp = current.timestamp;
            gaps.push_back(gap);
        }
    }

    keepMostRecent(gaps, analytics::PatternSet::kMaxFairValueGaps);
    return gaps;
}

} // namespace patterns
} // namespace marketlens
