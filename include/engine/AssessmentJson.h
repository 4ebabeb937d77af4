#pragma once

#include <nlohmann/json.hpp>
#include "analytics/AnalysisTypes.h"

namespace marketlens {
namespace engine {

// Wire form of the assessment. Absent optionals are written as null.
nlohmann::json toJson(const analytics::IntelligentAssessment& assessment);

nlohmann::json toJson(const analytics::MarketAssessment& assessment);
nlohmann::json toJson(const analytics::VolatilityIndicators& indicators);
nlohmann::json toJson(const analytics::PatternSet& patterns);
nlohmann::json toJson(const analytics::Recommendation& recommendation);
nlohmann::json toJson(const analytics::ComparativeResult& comparison);
nlohmann::json toJson(const analytics::MarketContext& context);

// Keys: market_sentiment, btc_trend, overall_volatility. Missing keys keep the defaults;
// a non-object throws std::runtime_error.
analytics::MarketContext marketContextFromJson(const nlohmann::json& j);

} // namespace engine
} // namespace marketlens
