#pragma once

#include "analytics/AnalysisTypes.h"
#include "analytics/CandleSeries.h"

namespace marketlens {
namespace analytics {

// Pairwise comparison of two equal-timeframe series
class ComparativeAnalyzer {
public:
    static ComparativeResult compare(const CandleSeries& primary, const CandleSeries& companion);

    // Closes paired on equal timestamps (both series are strictly ascending)
    static void alignCloses(const CandleSeries& a, const CandleSeries& b,
                            std::vector<double>& closes_a, std::vector<double>& closes_b);
};

} // namespace analytics
} // namespace marketlens
