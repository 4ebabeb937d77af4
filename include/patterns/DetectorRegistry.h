#pragma once

#include "patterns/IPatternDetector.h"
#include <memory>
#include <string>
#include <vector>

namespace marketlens {
namespace patterns {

// Fixed set of the seven structural detectors.
class DetectorRegistry {
public:
    // Order block, FVG, BOS, ChoCH, liquidity zone, anchored VWAP, RSI divergence
    static const std::vector<std::shared_ptr<const IPatternDetector>>& defaultDetectors();

    static std::vector<std::string> detectorNames();

    // Sequential run of every detector into one PatternSet
    static analytics::PatternSet runAll(const analytics::CandleSeries& series);
};

} // namespace patterns
} // namespace marketlens
