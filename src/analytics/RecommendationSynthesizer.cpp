#include "analytics/RecommendationSynthesizer.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace marketlens {
namespace analytics {

RecommendationSynthesizer::RecommendationSynthesizer(const engine::AnalysisConfig& config)
    : config_(config)
{
}

double RecommendationSynthesizer::trendScore(Trend trend) {
    if (trend == Trend::BULLISH) return 1.0;
    if (trend == Trend::BEARISH) return -1.0;
    return 0.0;
}

double RecommendationSynthesizer::volatilityScore(VolatilityLevel level) {
    if (level == VolatilityLevel::HIGH) return -0.5;
    if (level == VolatilityLevel::LOW) return 0.5;
    return 0.0;
}

double RecommendationSynthesizer::divergenceScore(const std::vector<RSIDivergence>& divergences) {
    double score = 0.0;
    for (const auto& div : divergences) {
        score += div.type == Direction::BULLISH ? 0.5 : -0.5;
    }
    return score;
}

double RecommendationSynthesizer::structureScore(const std::vector<BreakOfStructure>& breaks) {
    double score = 0.0;
    for (const auto& bos : breaks) {
        score += bos.direction == Direction::BULLISH ? 0.3 : -0.3;
    }
    return score;
}

Recommendation RecommendationSynthesizer::synthesize(
    const CandleSeries& series,
    const MarketAssessment& assessment,
    const VolatilityIndicators& volatility,
    const PatternSet& patterns
) const {
    Recommendation rec;

    const double total_score = trendScore(assessment.trend)
        + volatilityScore(assessment.volatility)
        + divergenceScore(patterns.rsi_divergence)
        + structureScore(patterns.break_of_structure);
    rec.total_score = total_score;

    if (total_score > config_.buy_threshold) {
        rec.action = Action::BUY;
    } else if (total_score < config_.sell_threshold) {
        rec.action = Action::SELL;
    } else {
        rec.action = Action::HOLD;
    }

    rec.confidence = std::clamp(std::abs(total_score) * 100.0, 0.0, 100.0);

    std::ostringstream reasoning;
    reasoning << "Based on trend analysis (" << toString(assessment.trend) << "), "
              << "volatility (" << toString(assessment.volatility) << "), "
              << "and technical indicators. Score: "
              << std::fixed << std::setprecision(2) << total_score;
    rec.reasoning = reasoning.str();

    if (rec.action == Action::HOLD || series.empty()) {
        return rec;
    }

    const double current_price = series.back().close;
    const int side = rec.action == Action::BUY ? 1 : -1;
    rec.target_price = current_price * (1.0 + side * config_.target_pct);

    if (volatility.average_true_range) {
        rec.stop_loss = current_price - side * (*volatility.average_true_range * config_.stop_atr_multiplier);
    } else {
        LOG_WARN("{}: ATR unavailable, {} recommendation issued without stop-loss",
                 series.symbol(), toString(rec.action));
    }

    return rec;
}

} // namespace analytics
} // namespace marketlens
