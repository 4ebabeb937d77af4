#include "engine/AssessmentJson.h"
#include <stdexcept>

namespace marketlens {
namespace engine {

using namespace analytics;

namespace {
template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}
}

nlohmann::json toJson(const MarketAssessment& assessment) {
    return {
        {"trend", toString(assessment.trend)},
        {"volatility", toString(assessment.volatility)},
        {"confidence", assessment.confidence}
    };
}

nlohmann::json toJson(const VolatilityIndicators& indicators) {
    return {
        {"bollinger_bands_width", optionalToJson(indicators.bollinger_bands_width)},
        {"average_true_range", optionalToJson(indicators.average_true_range)},
        {"volatility_level", toString(indicators.volatility_level)}
    };
}

nlohmann::json toJson(const PatternSet& patterns) {
    nlohmann::json j;

    j["order_blocks"] = nlohmann::json::array();
    for (const auto& ob : patterns.order_blocks) {
        j["order_blocks"].push_back({
            {"level", ob.level},
            {"type", toString(ob.type)},
            {"strength", ob.strength},
            {"timestamp", ob.timestamp}
        });
    }

    j["fair_value_gaps"] = nlohmann::json::array();
    for (const auto& gap : patterns.fair_value_gaps) {
        j["fair_value_gaps"].push_back({
            {"upper_level", gap.upper_level},
            {"lower_level", gap.lower_level},
            {"type", toString(gap.type)},
            {"timestamp", gap.timestamp}
        });
    }

    j["break_of_structure"] = nlohmann::json::array();
    for (const auto& bos : patterns.break_of_structure) {
        j["break_of_structure"].push_back({
            {"level", bos.level},
            {"direction", toString(bos.direction)},
            {"strength", bos.strength},
            {"timestamp", bos.timestamp}
        });
    }

    j["change_of_character"] = nlohmann::json::array();
    for (const auto& choch : patterns.change_of_character) {
        j["change_of_character"].push_back({
            {"type", toString(choch.type)},
            {"level", choch.level},
            {"strength", choch.strength},
            {"timestamp", choch.timestamp}
        });
    }

    j["liquidity_zones"] = nlohmann::json::array();
    for (const auto& zone : patterns.liquidity_zones) {
        j["liquidity_zones"].push_back({
            {"upper_level", zone.upper_level},
            {"lower_level", zone.lower_level},
            {"volume", zone.volume},
            {"type", toString(zone.type)},
            {"timestamp", zone.timestamp}
        });
    }

    j["anchored_vwap"] = nlohmann::json::array();
    for (const auto& vwap : patterns.anchored_vwap) {
        j["anchored_vwap"].push_back({
            {"anchor_point", vwap.anchor_point},
            {"current_vwap", vwap.current_vwap},
            {"anchor_type", toString(vwap.anchor_type)},
            {"timestamp", vwap.timestamp}
        });
    }

    j["rsi_divergence"] = nlohmann::json::array();
    for (const auto& div : patterns.rsi_divergence) {
        j["rsi_divergence"].push_back({
            {"type", toString(div.type)},
            {"rsi_value", div.rsi_value},
            {"strength", div.strength},
            {"timestamp", div.timestamp}
        });
    }

    return j;
}

nlohmann::json toJson(const Recommendation& recommendation) {
    return {
        {"action", toString(recommendation.action)},
        {"confidence", recommendation.confidence},
        {"reasoning", recommendation.reasoning},
        {"target_price", optionalToJson(recommendation.target_price)},
        {"stop_loss", optionalToJson(recommendation.stop_loss)},
        {"total_score", recommendation.total_score}
    };
}

nlohmann::json toJson(const ComparativeResult& comparison) {
    return {
        {"comparison_symbol", comparison.comparison_symbol},
        {"correlation", comparison.correlation},
        {"relative_strength", toString(comparison.relative_strength)},
        {"trend_alignment", comparison.trend_alignment},
        {"aligned_points", comparison.aligned_points}
    };
}

nlohmann::json toJson(const MarketContext& context) {
    return {
        {"market_sentiment", toString(context.market_sentiment)},
        {"btc_trend", toString(context.reference_trend)},
        {"overall_volatility", toString(context.overall_volatility)}
    };
}

nlohmann::json toJson(const IntelligentAssessment& assessment) {
    nlohmann::json j;
    j["symbol"] = assessment.symbol;
    j["timeframe"] = assessment.timeframe;
    j["market_analysis"] = toJson(assessment.market_analysis);
    j["volatility_indicators"] = toJson(assessment.volatility_indicators);
    j["patterns"] = toJson(assessment.patterns);
    j["recommendation"] = toJson(assessment.recommendation);

    j["comparative_analysis"] = assessment.comparative_analysis
        ? toJson(*assessment.comparative_analysis)
        : nlohmann::json(nullptr);
    j["market_context"] = assessment.market_context
        ? toJson(*assessment.market_context)
        : nlohmann::json(nullptr);

    j["intelligent_score"] = assessment.intelligent_score;
    j["regime"] = toString(assessment.regime);
    j["risk_adjusted_recommendation"] = toString(assessment.risk_adjusted_recommendation);

    j["metadata"] = {
        {"data_points", assessment.metadata.data_points},
        {"current_price", optionalToJson(assessment.metadata.current_price)},
        {"as_of", optionalToJson(assessment.metadata.as_of)}
    };
    return j;
}

MarketContext marketContextFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("market context must be a JSON object");
    }

    MarketContext context;
    context.market_sentiment = sentimentFromString(j.value("market_sentiment", std::string("unknown")));
    context.reference_trend = trendFromString(j.value("btc_trend", std::string("unknown")));
    if (j.contains("overall_volatility")) {
        context.overall_volatility = volatilityFromString(j.value("overall_volatility", std::string("moderate")));
    }
    return context;
}

} // namespace engine
} // namespace marketlens
