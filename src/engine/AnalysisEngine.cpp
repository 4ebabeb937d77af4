#include "engine/AnalysisEngine.h"
#include "analytics/ComparativeAnalyzer.h"
#include "analytics/TrendClassifier.h"
#include "common/Logger.h"
#include "patterns/DetectorRegistry.h"
#include <future>

namespace marketlens {
namespace engine {

using namespace analytics;

AnalysisEngine::AnalysisEngine(const AnalysisConfig& config)
    : config_(config)
    , synthesizer_(config)
    , scorer_(config.scoring)
{
}

PatternSet AnalysisEngine::detectPatterns(const CandleSeries& series, MarketAssessment& assessment) const {
    const auto& detectors = patterns::DetectorRegistry::defaultDetectors();

    if (!config_.parallel_detectors) {
        assessment = TrendClassifier::classify(series);
        return patterns::DetectorRegistry::runAll(series);
    }

    // Each task writes only its own PatternSet member (or the assessment)
    PatternSet out;
    std::vector<std::future<void>> tasks;
    tasks.reserve(detectors.size() + 1);

    tasks.push_back(std::async(std::launch::async, [&series, &assessment]() {
        assessment = TrendClassifier::classify(series);
    }));
    for (const auto& detector : detectors) {
        tasks.push_back(std::async(std::launch::async, [&series, &out, detector]() {
            detector->run(series, out);
        }));
    }

    // Join everything before rethrowing the first failure
    for (auto& task : tasks) {
        task.wait();
    }
    for (auto& task : tasks) {
        task.get();
    }
    return out;
}

IntelligentAssessment AnalysisEngine::analyze(
    const CandleSeries& input,
    const std::optional<MarketContext>& context,
    const CandleSeries* companion
) const {
    const CandleSeries series = config_.default_limit > 0
        ? input.tail(static_cast<size_t>(config_.default_limit))
        : input;

    IntelligentAssessment result;
    result.symbol = series.symbol();
    result.timeframe = series.timeframe();

    if (series.empty()) {
        LOG_WARN("Analyzing {} {}: empty candle series", series.symbol(), series.timeframe());
    } else if (series.size() < TrendClassifier::kMinTrendCandles) {
        LOG_WARN("Analyzing {} {}: {} candles, trend needs {}",
                 series.symbol(), series.timeframe(), series.size(), TrendClassifier::kMinTrendCandles);
    }

    result.patterns = detectPatterns(series, result.market_analysis);
    LOG_DEBUG("{} classified: trend={}, volatility={}, confidence={:.1f}",
              series.symbol(), toString(result.market_analysis.trend),
              toString(result.market_analysis.volatility), result.market_analysis.confidence);
    LOG_DEBUG("{} patterns: ob={}, fvg={}, bos={}, choch={}, lz={}, avwap={}, rsi_div={}",
              series.symbol(),
              result.patterns.order_blocks.size(), result.patterns.fair_value_gaps.size(),
              result.patterns.break_of_structure.size(), result.patterns.change_of_character.size(),
              result.patterns.liquidity_zones.size(), result.patterns.anchored_vwap.size(),
              result.patterns.rsi_divergence.size());

    result.volatility_indicators =
        TrendClassifier::volatilityIndicators(series, result.market_analysis.volatility);

    result.recommendation = synthesizer_.synthesize(
        series, result.market_analysis, result.volatility_indicators, result.patterns);
    LOG_DEBUG("{} recommendation: {} (score {:.2f}, confidence {:.1f})",
              series.symbol(), toString(result.recommendation.action),
              result.recommendation.total_score, result.recommendation.confidence);

    if (companion != nullptr) {
        // Both sides see the same window
        const CandleSeries other = config_.default_limit > 0
            ? companion->tail(static_cast<size_t>(config_.default_limit))
            : *companion;
        result.comparative_analysis = ComparativeAnalyzer::compare(series, other);
    }

    result.market_context = context;
    result.intelligent_score = scorer_.score(
        result.market_analysis, result.patterns, result.recommendation, context);
    result.regime = regime_detector_.determineRegime(context);
    result.risk_adjusted_recommendation =
        regime_detector_.adjustForRisk(result.recommendation.action, result.regime, context);
    LOG_DEBUG("{} intelligent score {:.1f}, regime {}, risk-adjusted {}",
              series.symbol(), result.intelligent_score, toString(result.regime),
              toString(result.risk_adjusted_recommendation));

    result.metadata.data_points = series.size();
    if (!series.empty()) {
        result.metadata.current_price = series.back().close;
        result.metadata.as_of = series.back().timestamp;
    }

    return result;
}

MarketContext AnalysisEngine::buildMarketContext(const std::vector<CandleSeries>& references) const {
    std::vector<MarketAssessment> assessments;
    assessments.reserve(references.size());
    for (const auto& reference : references) {
        assessments.push_back(TrendClassifier::classify(reference));
        LOG_DEBUG("Reference {}: trend={}, volatility={}", reference.symbol(),
                  toString(assessments.back().trend), toString(assessments.back().volatility));
    }
    return MarketContext::fromReferences(assessments);
}

} // namespace engine
} // namespace marketlens
