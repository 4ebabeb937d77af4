#include "analytics/IntelligentScorer.h"
#include <algorithm>

namespace marketlens {
namespace analytics {

IntelligentScorer::IntelligentScorer(const engine::ScoringWeights& weights)
    : weights_(weights)
{
}

bool IntelligentScorer::alignedWith(ZoneType type, Trend trend) {
    return (type == ZoneType::DEMAND && trend == Trend::BULLISH) ||
           (type == ZoneType::SUPPLY && trend == Trend::BEARISH);
}

bool IntelligentScorer::alignedWith(Direction direction, Trend trend) {
    return (direction == Direction::BULLISH && trend == Trend::BULLISH) ||
           (direction == Direction::BEARISH && trend == Trend::BEARISH);
}

double IntelligentScorer::score(
    const MarketAssessment& assessment,
    const PatternSet& patterns,
    const Recommendation& recommendation,
    const std::optional<MarketContext>& context
) const {
    const Trend trend = assessment.trend;
    double score = kBaseScore;

    if (trend == Trend::BULLISH) {
        score += weights_.trend_weight;
    } else if (trend == Trend::BEARISH) {
        score -= weights_.trend_weight;
    }

    if (assessment.volatility == VolatilityLevel::HIGH) {
        score -= weights_.high_volatility_penalty;
    } else if (assessment.volatility == VolatilityLevel::LOW) {
        score += weights_.low_volatility_bonus;
    }

    for (const auto& block : patterns.order_blocks) {
        if (alignedWith(block.type, trend)) {
            score += block.strength * weights_.order_block_weight;
        }
    }

    for (const auto& gap : patterns.fair_value_gaps) {
        if (alignedWith(gap.type, trend)) {
            score += weights_.fvg_bonus;
        }
    }

    for (const auto& bos : patterns.break_of_structure) {
        if (alignedWith(bos.direction, trend)) {
            score += bos.strength * weights_.bos_weight;
        }
    }

    // Local trend agrees with the broad market
    if (context) {
        const Sentiment mood = context->market_sentiment;
        if ((mood == Sentiment::BULLISH && trend == Trend::BULLISH) ||
            (mood == Sentiment::BEARISH && trend == Trend::BEARISH)) {
            score += weights_.sentiment_bonus;
        }
    }

    score = (score + recommendation.confidence) / 2.0;
    return std::clamp(score, 0.0, 100.0);
}

} // namespace analytics
} // namespace marketlens
