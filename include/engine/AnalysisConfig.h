#pragma once

namespace marketlens {
namespace engine {

// Calibration constants of the intelligent score. Heuristic weights, not a fitted model.
struct ScoringWeights {
    double trend_weight = 15.0;             // +/- for bullish/bearish
    double high_volatility_penalty = 10.0;
    double low_volatility_bonus = 5.0;
    double order_block_weight = 0.5;        // x strength, trend-aligned blocks only
    double bos_weight = 0.3;                // x strength, trend-aligned breaks only
    double fvg_bonus = 15.0;                // per trend-aligned gap
    double sentiment_bonus = 8.0;           // context sentiment == local trend
};

struct AnalysisConfig {
    // Run classifier + detectors as parallel tasks
    bool parallel_detectors = true;

    // Candles kept from the tail of the supplied series
    int default_limit = 500;

    // Recommendation
    double buy_threshold = 0.5;             // total score > threshold => BUY
    double sell_threshold = -0.5;           // total score < threshold => SELL
    double target_pct = 0.03;               // 3% target
    double stop_atr_multiplier = 1.5;       // 1.5 ATR stop

    ScoringWeights scoring;
};

} // namespace engine
} // namespace marketlens
