#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace marketlens {

namespace {
std::string normalizeLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // spdlog spells it "warning"
    if (level == "warning") {
        return "warn";
    }
    return level;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    loaded_ = false;
    analysis_config_ = engine::AnalysisConfig();
}

void Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveInputPath(path);

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    LOG_INFO("Config loaded: {}", config_path.string());
}

void Config::loadFromJson(const nlohmann::json& j) {
    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            log_level_ = normalizeLevel(l.value("level", std::string("info")));
            log_dir_ = l.value("dir", std::string("logs"));
        }

        if (j.contains("analysis")) {
            const auto& a = j["analysis"];
            auto& cfg = analysis_config_;
            cfg.parallel_detectors = a.value("parallel_detectors", true);
            cfg.default_limit = a.value("default_limit", 500);
            cfg.buy_threshold = a.value("buy_threshold", 0.5);
            cfg.sell_threshold = a.value("sell_threshold", -0.5);
            cfg.target_pct = a.value("target_pct", 0.03);
            cfg.stop_atr_multiplier = a.value("stop_atr_multiplier", 1.5);
        }

        if (j.contains("scoring")) {
            const auto& s = j["scoring"];
            auto& w = analysis_config_.scoring;
            w.trend_weight = s.value("trend_weight", 15.0);
            w.high_volatility_penalty = s.value("high_volatility_penalty", 10.0);
            w.low_volatility_bonus = s.value("low_volatility_bonus", 5.0);
            w.order_block_weight = s.value("order_block_weight", 0.5);
            w.bos_weight = s.value("bos_weight", 0.3);
            w.fvg_bonus = s.value("fvg_bonus", 15.0);
            w.sentiment_bonus = s.value("sentiment_bonus", 8.0);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (analysis_config_.default_limit <= 0) {
        throw std::runtime_error("analysis.default_limit must be positive");
    }
    if (analysis_config_.buy_threshold < analysis_config_.sell_threshold) {
        throw std::runtime_error("analysis.buy_threshold must not be below sell_threshold");
    }

    loaded_ = true;
}

} // namespace marketlens
