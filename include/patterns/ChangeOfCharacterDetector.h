#pragma once

#include "patterns/IPatternDetector.h"

namespace marketlens {
namespace patterns {

// Change of Character - EMA9 / EMA21 crossover against the previous candle
class ChangeOfCharacterDetector : public IPatternDetector {
public:
    static constexpr size_t kMinCandles = 30;
    static constexpr size_t kFirstIndex = 21;

    std::string name() const override { return "change_of_character"; }
    void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const override;

    static std::vector<analytics::ChangeOfCharacter> detect(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
