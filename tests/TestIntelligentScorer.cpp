#include "analytics/IntelligentScorer.h"
#include "analytics/RegimeDetector.h"
#include "TestCandles.h"

#include <cassert>
#include <iostream>

using namespace marketlens;
using namespace marketlens::analytics;
using marketlens::testing::near;

namespace {

MarketContext context(Sentiment sentiment, Trend trend, VolatilityLevel volatility) {
    MarketContext ctx;
    ctx.market_sentiment = sentiment;
    ctx.reference_trend = trend;
    ctx.overall_volatility = volatility;
    return ctx;
}

MarketAssessment assessment(Trend trend, VolatilityLevel volatility) {
    MarketAssessment a;
    a.trend = trend;
    a.volatility = volatility;
    return a;
}

void testScore() {
    IntelligentScorer scorer{engine::ScoringWeights()};

    Recommendation rec;
    rec.confidence = 40.0;

    // Neutral: (50 + 40) / 2
    assert(near(scorer.score(assessment(Trend::SIDEWAYS, VolatilityLevel::MODERATE), PatternSet(), rec, std::nullopt), 45.0));

    // Bullish, low vol, aligned demand block (60) and a misaligned supply block
    PatternSet patterns;
    OrderBlock demand;
    demand.type = ZoneType::DEMAND;
    demand.strength = 60.0;
    OrderBlock supply;
    supply.type = ZoneType::SUPPLY;
    supply.strength = 80.0;
    patterns.order_blocks = {demand, supply};

    BreakOfStructure bos;
    bos.direction = Direction::BULLISH;
    bos.strength = 10.0;
    patterns.break_of_structure = {bos};

    FairValueGap bearish_gap;
    bearish_gap.type = Direction::BEARISH;
    patterns.fair_value_gaps = {bearish_gap};

    // 50 + 15 + 5 + 30 + 3 = 103 -> (103 + 40) / 2
    auto bull = assessment(Trend::BULLISH, VolatilityLevel::LOW);
    assert(near(scorer.score(bull, patterns, rec, std::nullopt), 71.5));

    // Sentiment agreement adds 8 before averaging
    auto ctx = context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::LOW);
    assert(near(scorer.score(bull, patterns, rec, ctx), 75.5));

    // Bearish trend with high volatility: 50 - 15 - 10 + 0.5*80 (supply) + 15 (bearish gap) = 80
    auto bear = assessment(Trend::BEARISH, VolatilityLevel::HIGH);
    assert(near(scorer.score(bear, patterns, rec, std::nullopt), 60.0));

    // Each aligned gap adds 15
    patterns.fair_value_gaps.push_back(bearish_gap);
    assert(near(scorer.score(bear, patterns, rec, std::nullopt), (95.0 + 40.0) / 2.0));

    // Clamped to [0, 100]
    PatternSet many;
    many.fair_value_gaps.assign(5, FairValueGap());
    rec.confidence = 100.0;
    assert(scorer.score(bull, many, rec, ctx) == 100.0);

    engine::ScoringWeights harsh;
    harsh.trend_weight = 200.0;
    IntelligentScorer harsh_scorer(harsh);
    rec.confidence = 0.0;
    assert(harsh_scorer.score(assessment(Trend::BEARISH, VolatilityLevel::HIGH), PatternSet(), rec, std::nullopt) == 0.0);
}

void testRegime() {
    RegimeDetector detector;

    assert(detector.determineRegime(std::nullopt) == MarketRegime::UNKNOWN);
    assert(detector.determineRegime(context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::LOW))
           == MarketRegime::BULL_MARKET);
    assert(detector.determineRegime(context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::MODERATE))
           == MarketRegime::BULL_MARKET);
    // unknown volatility reads as moderate
    assert(detector.determineRegime(context(Sentiment::UNKNOWN, Trend::BULLISH, VolatilityLevel::UNKNOWN))
           == MarketRegime::BULL_MARKET);
    assert(detector.determineRegime(context(Sentiment::BEARISH, Trend::BEARISH, VolatilityLevel::HIGH))
           == MarketRegime::BEAR_MARKET);
    assert(detector.determineRegime(context(Sentiment::BULLISH, Trend::SIDEWAYS, VolatilityLevel::HIGH))
           == MarketRegime::RANGE_BOUND);
    assert(detector.determineRegime(context(Sentiment::NEUTRAL, Trend::BEARISH, VolatilityLevel::LOW))
           == MarketRegime::RANGE_BOUND);
    assert(detector.determineRegime(context(Sentiment::BEARISH, Trend::BEARISH, VolatilityLevel::LOW))
           == MarketRegime::TRANSITIONAL);
    assert(detector.determineRegime(context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::HIGH))
           == MarketRegime::TRANSITIONAL);
    assert(detector.determineRegime(context(Sentiment::UNKNOWN, Trend::UNKNOWN, VolatilityLevel::MODERATE))
           == MarketRegime::TRANSITIONAL);
}

void testRiskAdjustment() {
    RegimeDetector detector;

    // No context: pass-through
    assert(detector.adjustForRisk(Action::BUY, MarketRegime::UNKNOWN, std::nullopt) == RiskAdjustedAction::BUY);
    assert(detector.adjustForRisk(Action::SELL, MarketRegime::UNKNOWN, std::nullopt) == RiskAdjustedAction::SELL);
    assert(detector.adjustForRisk(Action::HOLD, MarketRegime::UNKNOWN, std::nullopt) == RiskAdjustedAction::HOLD);

    auto high = context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::HIGH);
    assert(detector.adjustForRisk(Action::BUY, detector.determineRegime(high), high) == RiskAdjustedAction::CAUTIOUS_BUY);
    assert(detector.adjustForRisk(Action::SELL, detector.determineRegime(high), high) == RiskAdjustedAction::STRONG_SELL);
    assert(detector.adjustForRisk(Action::HOLD, detector.determineRegime(high), high) == RiskAdjustedAction::HOLD);

    // High volatility wins over a bull regime
    assert(detector.adjustForRisk(Action::BUY, MarketRegime::BULL_MARKET, high) == RiskAdjustedAction::CAUTIOUS_BUY);

    auto bull = context(Sentiment::BULLISH, Trend::BULLISH, VolatilityLevel::LOW);
    assert(detector.adjustForRisk(Action::BUY, MarketRegime::BULL_MARKET, bull) == RiskAdjustedAction::STRONG_BUY);
    assert(detector.adjustForRisk(Action::SELL, MarketRegime::BULL_MARKET, bull) == RiskAdjustedAction::SELL);

    auto range = context(Sentiment::NEUTRAL, Trend::SIDEWAYS, VolatilityLevel::LOW);
    assert(detector.adjustForRisk(Action::BUY, MarketRegime::RANGE_BOUND, range) == RiskAdjustedAction::BUY);
    assert(detector.adjustForRisk(Action::SELL, MarketRegime::BEAR_MARKET, range) == RiskAdjustedAction::STRONG_SELL);
}

void testContextFromReferences() {
    auto empty = MarketContext::fromReferences({});
    assert(empty.market_sentiment == Sentiment::UNKNOWN);
    assert(empty.reference_trend == Trend::UNKNOWN);
    assert(empty.overall_volatility == VolatilityLevel::MODERATE);

    auto mixed = MarketContext::fromReferences({
        assessment(Trend::BEARISH, VolatilityLevel::HIGH),
        assessment(Trend::BULLISH, VolatilityLevel::LOW),
    });
    assert(mixed.market_sentiment == Sentiment::NEUTRAL);
    assert(mixed.reference_trend == Trend::BEARISH);
    assert(mixed.overall_volatility == VolatilityLevel::MODERATE);

    auto bullish = MarketContext::fromReferences({
        assessment(Trend::BULLISH, VolatilityLevel::HIGH),
        assessment(Trend::BULLISH, VolatilityLevel::MODERATE),
        assessment(Trend::SIDEWAYS, VolatilityLevel::HIGH),
    });
    assert(bullish.market_sentiment == Sentiment::BULLISH);
    assert(bullish.reference_trend == Trend::BULLISH);
    assert(bullish.overall_volatility == VolatilityLevel::HIGH);

    auto calm = MarketContext::fromReferences({
        assessment(Trend::BEARISH, VolatilityLevel::LOW),
    });
    assert(calm.market_sentiment == Sentiment::BEARISH);
    assert(calm.overall_volatility == VolatilityLevel::LOW);
}

} // namespace

int main() {
    testScore();
    testRegime();
    testRiskAdjustment();
    testContextFromReferences();

    std::cout << "[TEST] IntelligentScorer PASSED\n";
    return 0;
}
