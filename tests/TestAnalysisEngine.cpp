#include "engine/AnalysisEngine.h"
#include "engine/AssessmentJson.h"
#include "common/Errors.h"
#include "TestCandles.h"

#include <cassert>
#include <iostream>
#include <string>

using namespace marketlens;
using namespace marketlens::analytics;
using marketlens::engine::AnalysisConfig;
using marketlens::engine::AnalysisEngine;
using marketlens::testing::near;

namespace {

MarketContext bullishContext(VolatilityLevel volatility) {
    MarketContext ctx;
    ctx.market_sentiment = Sentiment::BULLISH;
    ctx.reference_trend = Trend::BULLISH;
    ctx.overall_volatility = volatility;
    return ctx;
}

void assertRanges(const IntelligentAssessment& a) {
    assert(a.market_analysis.confidence >= 0.0 && a.market_analysis.confidence <= 100.0);
    assert(a.recommendation.confidence >= 0.0 && a.recommendation.confidence <= 100.0);
    assert(a.intelligent_score >= 0.0 && a.intelligent_score <= 100.0);
    if (a.comparative_analysis) {
        assert(a.comparative_analysis->correlation >= -1.0 && a.comparative_analysis->correlation <= 1.0);
    }
    for (const auto& ob : a.patterns.order_blocks) {
        assert(ob.strength >= 0.0 && ob.strength <= 100.0);
    }
}

void testUptrendScenario() {
    AnalysisEngine engine;
    auto series = testing::makeSeries(testing::uptrendCandles(60), "KRW-BTC", "1h");
    auto result = engine.analyze(series);

    assert(result.symbol == "KRW-BTC");
    assert(result.timeframe == "1h");
    assert(result.market_analysis.trend == Trend::BULLISH);
    assert(result.market_analysis.volatility == VolatilityLevel::LOW);
    assert(result.recommendation.action == Action::BUY);
    assert(near(*result.recommendation.target_price, 159.0 * 1.03));
    assert(result.patterns.fair_value_gaps.size() == 5);
    assert(result.intelligent_score == 100.0);
    assert(!result.comparative_analysis.has_value());
    assert(!result.market_context.has_value());
    assert(result.regime == MarketRegime::UNKNOWN);
    assert(result.risk_adjusted_recommendation == RiskAdjustedAction::BUY);
    assert(result.metadata.data_points == 60);
    assert(*result.metadata.current_price == 159.0);
    assert(*result.metadata.as_of == series.back().timestamp);
    assertRanges(result);

    // Bull regime upgrades the BUY; high market volatility downgrades it
    auto bull = engine.analyze(series, bullishContext(VolatilityLevel::LOW));
    assert(bull.regime == MarketRegime::BULL_MARKET);
    assert(bull.risk_adjusted_recommendation == RiskAdjustedAction::STRONG_BUY);
    assert(bull.market_context.has_value());

    auto stormy = engine.analyze(series, bullishContext(VolatilityLevel::HIGH));
    assert(stormy.regime == MarketRegime::TRANSITIONAL);
    assert(stormy.risk_adjusted_recommendation == RiskAdjustedAction::CAUTIOUS_BUY);
}

void testFlatScenario() {
    AnalysisEngine engine;
    auto result = engine.analyze(testing::makeSeries(testing::flatCandles(60)));
    assert(result.market_analysis.trend == Trend::SIDEWAYS);
    assert(result.market_analysis.volatility == VolatilityLevel::LOW);
    assert(result.recommendation.action == Action::HOLD);
    assert(!result.recommendation.target_price.has_value());
    assert(!result.recommendation.stop_loss.has_value());
    // (50 + 5 low volatility + 50 confidence) / 2
    assert(near(result.intelligent_score, 52.5));
    assert(result.risk_adjusted_recommendation == RiskAdjustedAction::HOLD);
    assertRanges(result);

    auto json = engine::toJson(result);
    assert(json["recommendation"]["target_price"].is_null());
    assert(json["recommendation"]["stop_loss"].is_null());
}

void testDowntrendScenario() {
    AnalysisEngine engine;
    MarketContext ctx;
    ctx.market_sentiment = Sentiment::BEARISH;
    ctx.reference_trend = Trend::BEARISH;
    ctx.overall_volatility = VolatilityLevel::HIGH;

    auto result = engine.analyze(testing::makeSeries(testing::downtrendCandles(60)), ctx);
    assert(result.market_analysis.trend == Trend::BEARISH);
    assert(result.recommendation.action == Action::SELL);
    assert(result.regime == MarketRegime::BEAR_MARKET);
    assert(result.risk_adjusted_recommendation == RiskAdjustedAction::STRONG_SELL);
    assert(*result.recommendation.stop_loss > *result.metadata.current_price);
    assertRanges(result);
}

void testFairValueGapScenario() {
    std::vector<Candle> candles;
    for (size_t i = 0; i < 10; ++i) {
        candles.emplace_back(100.0, 100.5, 99.5, 100.0, 1000.0, testing::timestampAt(i));
    }
    // #10 gaps above #8
    candles.emplace_back(100.0, 102.0, 100.0, 101.8, 1000.0, testing::timestampAt(10));
    candles.emplace_back(101.8, 103.5, 101.2, 103.0, 1000.0, testing::timestampAt(11));

    AnalysisEngine engine;
    auto result = engine.analyze(testing::makeSeries(candles));
    const auto& gaps = result.patterns.fair_value_gaps;
    assert(gaps.size() == 1);
    assert(gaps[0].type == Direction::BULLISH);
    assert(gaps[0].lower_level == 100.5);
    assert(gaps[0].upper_level == 101.2);
    assert(gaps[0].timestamp == testing::timestampAt(11));

    // Short series: trend unknown, volatility unknown, no divergences
    assert(result.market_analysis.trend == Trend::UNKNOWN);
    assert(result.market_analysis.volatility == VolatilityLevel::UNKNOWN);
    assert(result.patterns.rsi_divergence.empty());
    assert(!result.volatility_indicators.average_true_range.has_value());
}

void testComparativeSelfMatch() {
    AnalysisEngine engine;
    auto a = testing::makeSeries(testing::uptrendCandles(60), "KRW-SOL");
    auto b = testing::makeSeries(testing::uptrendCandles(60), "KRW-SOL2");
    auto result = engine.analyze(a, std::nullopt, &b);
    assert(result.comparative_analysis.has_value());
    assert(result.comparative_analysis->comparison_symbol == "KRW-SOL2");
    assert(near(result.comparative_analysis->correlation, 1.0));
    assert(result.comparative_analysis->trend_alignment);
    assert(result.comparative_analysis->relative_strength == RelativeStrength::NEUTRAL);
}

void testComparativeSelfMatchWithLimit() {
    // Random walk: a full-length trend differs from the trend of its 60-candle tail
    std::vector<double> closes;
    unsigned int state = 12345;
    double price = 100.0;
    for (int i = 0; i < 300; ++i) {
        state = state * 1103515245u + 12345u;
        price += (static_cast<double>((state >> 16) % 2001) / 1000.0 - 1.0);
        closes.push_back(price);
    }

    AnalysisConfig config;
    config.default_limit = 60;
    AnalysisEngine engine(config);
    auto a = testing::makeSeries(testing::candlesFromCloses(closes), "KRW-A");
    auto b = testing::makeSeries(testing::candlesFromCloses(closes), "KRW-B");
    auto result = engine.analyze(a, std::nullopt, &b);
    assert(result.metadata.data_points == 60);
    assert(result.comparative_analysis.has_value());
    assert(near(result.comparative_analysis->correlation, 1.0));
    assert(result.comparative_analysis->trend_alignment);
    assert(result.comparative_analysis->relative_strength == RelativeStrength::NEUTRAL);
}

void testDeterminismAndParallelism() {
    auto series = testing::makeSeries(testing::candlesFromCloses({
        100, 101, 103, 102, 99, 97, 98, 101, 104, 106, 105, 103, 100, 96, 95, 97, 100, 103, 107, 110,
        108, 105, 101, 98, 96, 95, 97, 99, 102, 104, 103, 101, 98, 97, 99, 102, 106, 109, 111, 112,
        110, 107, 104, 101, 99, 100, 103, 106, 108, 107, 105, 102, 100, 101, 104, 107, 109, 108, 106, 105
    }, 1500.0));

    AnalysisConfig parallel_config;
    parallel_config.parallel_detectors = true;
    AnalysisConfig sequential_config;
    sequential_config.parallel_detectors = false;

    AnalysisEngine parallel(parallel_config);
    AnalysisEngine sequential(sequential_config);

    const std::string first = engine::toJson(parallel.analyze(series)).dump();
    const std::string second = engine::toJson(parallel.analyze(series)).dump();
    const std::string third = engine::toJson(sequential.analyze(series)).dump();
    assert(first == second);
    assert(first == third);

    assertRanges(parallel.analyze(series));
}

void testLimitAndEmpty() {
    AnalysisConfig config;
    config.default_limit = 30;
    AnalysisEngine engine(config);
    auto result = engine.analyze(testing::makeSeries(testing::uptrendCandles(60)));
    assert(result.metadata.data_points == 30);
    assert(result.market_analysis.trend == Trend::UNKNOWN);   // 30 < 50
    assert(*result.metadata.current_price == 159.0);

    AnalysisEngine defaults;
    auto empty = defaults.analyze(testing::makeSeries({}, "KRW-NONE"));
    assert(empty.symbol == "KRW-NONE");
    assert(empty.recommendation.action == Action::HOLD);
    assert(empty.market_analysis.trend == Trend::UNKNOWN);
    assert(empty.metadata.data_points == 0);
    assert(!empty.metadata.current_price.has_value());
    assert(!empty.metadata.as_of.has_value());
    assertRanges(empty);
}

void testBuildMarketContext() {
    AnalysisEngine engine;
    std::vector<CandleSeries> references = {
        testing::makeSeries(testing::uptrendCandles(60), "KRW-BTC"),
        testing::makeSeries(testing::flatCandles(60), "KRW-ETH"),
    };
    auto ctx = engine.buildMarketContext(references);
    assert(ctx.reference_trend == Trend::BULLISH);
    assert(ctx.market_sentiment == Sentiment::BULLISH);
    assert(ctx.overall_volatility == VolatilityLevel::LOW);

    auto result = engine.analyze(testing::makeSeries(testing::uptrendCandles(60)), ctx);
    assert(result.regime == MarketRegime::BULL_MARKET);
}

void testInvalidInputPropagates() {
    auto candles = testing::uptrendCandles(10);
    candles[5].timestamp = candles[4].timestamp - 1;
    bool thrown = false;
    try {
        AnalysisEngine engine;
        engine.analyze(testing::makeSeries(candles));
    } catch (const InvalidInputError&) {
        thrown = true;
    }
    assert(thrown);
}

} // namespace

int main() {
    testUptrendScenario();
    testFlatScenario();
    testDowntrendScenario();
    testFairValueGapScenario();
    testComparativeSelfMatch();
    testComparativeSelfMatchWithLimit();
    testDeterminismAndParallelism();
    testLimitAndEmpty();
    testBuildMarketContext();
    testInvalidInputPropagates();

    std::cout << "[TEST] AnalysisEngine PASSED\n";
    return 0;
}
