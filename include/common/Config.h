#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/AnalysisConfig.h"

namespace marketlens {

class Config {
public:
    static Config& getInstance();

    // Missing file keeps the defaults; a malformed file throws std::runtime_error.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    bool isLoaded() const { return loaded_; }

    engine::AnalysisConfig getAnalysisConfig() const { return analysis_config_; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    bool loaded_ = false;

    engine::AnalysisConfig analysis_config_;
};

} // namespace marketlens
