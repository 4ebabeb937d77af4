#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Break of Structure - close beyond the swing high/low of the prior 10 candles.
// Swing levels are centered 5-candle rolling max(high) / min(low); only swings whose
// window closes before the candle under test count.
class BreakOfStructureDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 20;
    static constexpr int kSwingWindow = 5;
    static constexpr size_t kSwingLookahead = (kSwingWindow - 1) / 2;
    static constexpr size_t kLookback = 10;
    static constexpr size_t kTrailingSkip = 5;

    std::string name() const override { return "break_of_structure"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::BreakOfStructure> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
