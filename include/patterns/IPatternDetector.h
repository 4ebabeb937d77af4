#pragma once

#include "analytics/AnalysisTypes.h"
#include "analytics/CandleSeries.h"
#include <cstddef>
#include <string>
#include <vector>

namespace marketlens {
namespace patterns {

// Structural pattern detector. Implementations are stateless: run() reads the immutable
// series and writes only its own PatternSet member, so detectors may run concurrently
// against the same series and the same output set.
class IPatternDetector {
public:
    virtual ~IPatternDetector() = default;

    virtual std::string name() const = 0;

    // Below the detector's minimum lookback the output list is empty, never an error.
    virtual void run(const analytics::CandleSeries& series, analytics::PatternSet& out) const = 0;
};

// Drop the oldest detections beyond the cap
template<typename T>
void keepMostRecent(std::vector<T>& detections, size_t cap) {
    if (detections.size() > cap) {
        detections.erase(detections.begin(),
                         detections.begin() + static_cast<std::ptrdiff_t>(detections.size() - cap));
    }
}

} // namespace patterns
} // namespace marketlens
