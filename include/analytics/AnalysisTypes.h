#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "common/Types.h"

namespace marketlens {
namespace analytics {

struct MarketAssessment {
    Trend trend = Trend::UNKNOWN;
    VolatilityLevel volatility = VolatilityLevel::UNKNOWN;
    double confidence = 50.0;           // 0 ~ 100, heuristic weight
};

struct VolatilityIndicators {
    std::optional<double> bollinger_bands_width;   // % of middle band
    std::optional<double> average_true_range;
    VolatilityLevel volatility_level = VolatilityLevel::UNKNOWN;
};

// ===== Detections (one shape per pattern family) =====

struct OrderBlock {
    double level = 0.0;
    ZoneType type = ZoneType::DEMAND;
    double strength = 0.0;              // 0 ~ 100
    TimestampMs timestamp = 0;
};

struct FairValueGap {
    double upper_level = 0.0;
    double lower_level = 0.0;
    Direction type = Direction::BULLISH;
    TimestampMs timestamp = 0;
};

struct BreakOfStructure {
    double level = 0.0;                 // broken swing high/low
    Direction direction = Direction::BULLISH;
    double strength = 0.0;              // % overshoot
    TimestampMs timestamp = 0;
};

struct ChangeOfCharacter {
    Direction type = Direction::BULLISH;
    double level = 0.0;
    double strength = 0.0;              // |EMA9 - EMA21| / EMA21 * 100
    TimestampMs timestamp = 0;
};

struct LiquidityZone {
    double upper_level = 0.0;
    double lower_level = 0.0;
    double volume = 0.0;
    ZoneType type = ZoneType::DEMAND;
    TimestampMs timestamp = 0;
};

struct AnchoredVWAP {
    double anchor_point = 0.0;
    double current_vwap = 0.0;
    AnchorType anchor_type = AnchorType::HIGH;
    TimestampMs timestamp = 0;          // anchor candle
};

struct RSIDivergence {
    Direction type = Direction::BULLISH;
    double rsi_value = 0.0;
    double strength = 0.0;              // 2 x RSI delta
    TimestampMs timestamp = 0;
};

// Bounded per family, most recent last
struct PatternSet {
    static constexpr size_t kMaxOrderBlocks = 10;
    static constexpr size_t kMaxFairValueGaps = 5;
    static constexpr size_t kMaxBreaksOfStructure = 3;
    static constexpr size_t kMaxChangesOfCharacter = 3;
    static constexpr size_t kMaxLiquidityZones = 5;
    static constexpr size_t kMaxAnchoredVwaps = 3;
    static constexpr size_t kMaxRsiDivergences = 2;

    std::vector<OrderBlock> order_blocks;
    std::vector<FairValueGap> fair_value_gaps;
    std::vector<BreakOfStructure> break_of_structure;
    std::vector<ChangeOfCharacter> change_of_character;
    std::vector<LiquidityZone> liquidity_zones;
    std::vector<AnchoredVWAP> anchored_vwap;
    std::vector<RSIDivergence> rsi_divergence;
};

struct Recommendation {
    Action action = Action::HOLD;
    double confidence = 0.0;            // 0 ~ 100
    std::string reasoning;
    std::optional<double> target_price; // absent for HOLD
    std::optional<double> stop_loss;    // absent for HOLD
    double total_score = 0.0;
};

struct ComparativeResult {
    std::string comparison_symbol;
    double correlation = 0.0;           // -1 ~ 1, 0 when undefined
    RelativeStrength relative_strength = RelativeStrength::NEUTRAL;
    bool trend_alignment = false;
    size_t aligned_points = 0;
};

// External snapshot of the broader market (e.g. built from BTC/ETH assessments)
struct MarketContext {
    Sentiment market_sentiment = Sentiment::UNKNOWN;
    Trend reference_trend = Trend::UNKNOWN;
    VolatilityLevel overall_volatility = VolatilityLevel::MODERATE;

    // Sentiment: bullish/bearish majority (neutral on tie). Reference trend: first entry.
    // Volatility: high if highs outnumber lows, low if the reverse, moderate otherwise.
    static MarketContext fromReferences(const std::vector<MarketAssessment>& references);
};

struct AnalysisMetadata {
    size_t data_points = 0;
    std::optional<double> current_price;
    std::optional<TimestampMs> as_of;   // last candle
};

struct IntelligentAssessment {
    std::string symbol;
    std::string timeframe;

    MarketAssessment market_analysis;
    VolatilityIndicators volatility_indicators;
    PatternSet patterns;
    Recommendation recommendation;
    std::optional<ComparativeResult> comparative_analysis;
    std::optional<MarketContext> market_context;

    double intelligent_score = 50.0;    // 0 ~ 100
    MarketRegime regime = MarketRegime::UNKNOWN;
    RiskAdjustedAction risk_adjusted_recommendation = RiskAdjustedAction::HOLD;

    AnalysisMetadata metadata;
};

} // namespace analytics
} // namespace marketlens
