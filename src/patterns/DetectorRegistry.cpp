#include "patterns/DetectorRegistry.h"
#include "patterns/OrderBlockDetector.h"
#include "patterns/FairValueGapDetector.h"
#include "patterns/BreakOfStructureDetector.h"
#include "patterns/ChangeOfCharacterDetector.h"
#include "patterns/LiquidityZoneDetector.h"
#include "patterns/AnchoredVwapDetector.h"
#include "patterns/RsiDivergenceDetector.h"

namespace marketlens {
namespace patterns {

const std::vector<std::shared_ptr<const IPatternDetector>>& DetectorRegistry::defaultDetectors() {
    static const std::vector<std::shared_ptr<const IPatternDetector>> detectors = {
        std::make_shared<OrderBlockDetector>(),
        std::make_shared<FairValueGapDetector>(),
        std::make_shared<BreakOfStructureDetector>(),
        std::make_shared<ChangeOfCharacterDetector>(),
        std::make_shared<LiquidityZoneDetector>(),
        std::make_shared<AnchoredVwapDetector>(),
        std::make_shared<RsiDivergenceDetector>(),
    };
    return detectors;
}

std::vector<std::string> DetectorRegistry::detectorNames() {
    std::vector<std::string> names;
    for (const auto& detector : defaultDetectors()) {
        names.push_back(detector->name());
    }
    return names;
}

analytics::PatternSet DetectorRegistry::runAll(const analytics::CandleSeries& series) {
    analytics::PatternSet out;
    for (const auto& detector : defaultDetectors()) {
        detector->run(series, out);
    }
    return out;
}

} // namespace patterns
} // namespace marketlens
