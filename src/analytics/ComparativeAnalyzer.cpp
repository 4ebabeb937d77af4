#include "analytics/ComparativeAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "analytics/TrendClassifier.h"
#include "common/Logger.h"

namespace marketlens {
namespace analytics {

ComparativeResult ComparativeAnalyzer::compare(const CandleSeries& primary, const CandleSeries& companion) {
    ComparativeResult result;
    result.comparison_symbol = companion.symbol();

    std::vector<double> closes_a;
    std::vector<double> closes_b;
    alignCloses(primary, companion, closes_a, closes_b);
    result.aligned_points = closes_a.size();
    result.correlation = TechnicalIndicators::pearsonCorrelation(closes_a, closes_b);

    if (closes_a.size() < 2) {
        LOG_WARN("Comparative analysis {} vs {}: only {} aligned candles, correlation set to 0",
                 primary.symbol(), companion.symbol(), closes_a.size());
    }

    const Trend main_trend = TrendClassifier::determineTrend(primary);
    const Trend comp_trend = TrendClassifier::determineTrend(companion);

    if (main_trend == Trend::BULLISH && comp_trend != Trend::BULLISH) {
        result.relative_strength = RelativeStrength::OUTPERFORMING;
    } else if (main_trend != Trend::BULLISH && comp_trend == Trend::BULLISH) {
        result.relative_strength = RelativeStrength::UNDERPERFORMING;
    } else {
        result.relative_strength = RelativeStrength::NEUTRAL;
    }
    result.trend_alignment = main_trend == comp_trend;

    return result;
}

void ComparativeAnalyzer::alignCloses(const CandleSeries& a, const CandleSeries& b,
                                      std::vector<double>& closes_a, std::vector<double>& closes_b) {
    closes_a.clear();
    closes_b.clear();

    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const auto ts_a = a[i].timestamp;
        const auto ts_b = b[j].timestamp;
        if (ts_a == ts_b) {
            closes_a.push_back(a[i].close);
            closes_b.push_back(b[j].close);
            ++i;
            ++j;
        } else if (ts_a < ts_b) {
            ++i;
        } else {
            ++j;
        }
    }
}

} // namespace analytics
} // namespace marketlens
