#include "patterns/ChangeOfCharacterDetector.h"
#include <cmath>

namespace marketlens {
namespace patterns {

void ChangeOfCharacterDetector::run(const analytics::CandleSeries& series, analytics::PatternSet& out) const {
    out.change_of_character = detect(series);
}

std::vector<analytics::ChangeOfCharacter> ChangeOfCharacterDetector::detect(const analytics::CandleSeries& series) {
    std::vector<analytics::ChangeOfCharacter> changes;
    const size_t n = series.size();
    if (n < kMinCandles) {
        return changes;
    }

    const auto& ema_short = series.ema9();
    const auto& ema_long = series.ema21();

    for (size_t i = kFirstIndex; i < n; ++i) {
        const bool crossed_up = ema_short[i] > ema_long[i] && ema_short[i - 1] <= ema_long[i - 1];
        const bool crossed_down = ema_short[i] < ema_long[i] && ema_short[i - 1] >= ema_long[i - 1];
        if (!crossed_up && !crossed_down) {
            continue;
        }

        analytics::ChangeOfCharacter choch;
        choch.type = crossed_up ? Direction::BULLISH : Direction::BEARISH;
        choch.level = series[i].close;
        choch.strength = std::abs(ema_short[i] - ema_long[i]) / ema_long[i] * 100.0;
        choch.timestamp = series[i].timestamp;
        changes.push_back(choch);
    }

    keepMostRecent(changes, analytics::PatternSet::kMaxChangesOfCharacter);
    return changes;
}

} // namespace patterns
} // namespace marketlens
