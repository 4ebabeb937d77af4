#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "data/CandleLoader.h"
#include "engine/AnalysisEngine.h"
#include "engine/AssessmentJson.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace marketlens;

namespace {

struct CliOptions {
    std::string candles_path;
    std::string symbol;
    std::string timeframe = "1h";
    std::optional<int> limit;
    std::string compare_path;
    std::string compare_symbol;
    std::string context_path;
    std::vector<std::string> reference_paths;
    std::string config_path = "config/config.json";
};

void printUsage(const char* program) {
    std::cerr
        << "Usage: " << program << " <candles.csv|candles.json> [options]\n"
        << "  --symbol S           symbol label (default: file name)\n"
        << "  --timeframe TF       timeframe label (default: 1h)\n"
        << "  --limit N            analyze the most recent N candles\n"
        << "  --compare FILE       companion series for comparative analysis\n"
        << "  --compare-symbol S   companion symbol label\n"
        << "  --context FILE       market context JSON (market_sentiment, btc_trend, overall_volatility)\n"
        << "  --reference FILE     reference series for the market context (repeatable)\n"
        << "  --config FILE        config JSON (default: config/config.json)\n";
}

std::string requireValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--symbol") {
            options.symbol = requireValue(argc, argv, i);
        } else if (arg == "--timeframe") {
            options.timeframe = requireValue(argc, argv, i);
        } else if (arg == "--limit") {
            options.limit = std::stoi(requireValue(argc, argv, i));
            if (*options.limit <= 0) {
                throw std::invalid_argument("--limit must be positive");
            }
        } else if (arg == "--compare") {
            options.compare_path = requireValue(argc, argv, i);
        } else if (arg == "--compare-symbol") {
            options.compare_symbol = requireValue(argc, argv, i);
        } else if (arg == "--context") {
            options.context_path = requireValue(argc, argv, i);
        } else if (arg == "--reference") {
            options.reference_paths.push_back(requireValue(argc, argv, i));
        } else if (arg == "--config") {
            options.config_path = requireValue(argc, argv, i);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (options.candles_path.empty()) {
            options.candles_path = arg;
        } else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }
    if (options.candles_path.empty()) {
        throw std::invalid_argument("candle file is required");
    }
    return options;
}

std::string symbolFromPath(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

analytics::CandleSeries loadSeries(const std::string& path, const std::string& symbol,
                                   const std::string& timeframe) {
    const auto resolved = utils::PathUtils::resolveInputPath(path);
    auto candles = data::CandleLoader::load(resolved.string());
    return analytics::CandleSeries::create(
        symbol.empty() ? symbolFromPath(path) : symbol, timeframe, std::move(candles));
}

analytics::MarketContext loadContext(const std::string& path) {
    const auto resolved = utils::PathUtils::resolveInputPath(path);
    std::ifstream file(resolved);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open context file: " + resolved.string());
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed context file " + resolved.string() + ": " + e.what());
    }
    return engine::marketContextFromJson(j);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        engine::AnalysisConfig analysis_config = config.getAnalysisConfig();
        if (options.limit) {
            analysis_config.default_limit = *options.limit;
        }
        engine::AnalysisEngine engine(analysis_config);

        const auto series = loadSeries(options.candles_path, options.symbol, options.timeframe);
        LOG_INFO("Analyzing {} {} ({} candles)", series.symbol(), series.timeframe(), series.size());

        std::optional<analytics::MarketContext> context;
        if (!options.context_path.empty()) {
            context = loadContext(options.context_path);
        } else if (!options.reference_paths.empty()) {
            std::vector<analytics::CandleSeries> references;
            for (const auto& path : options.reference_paths) {
                references.push_back(loadSeries(path, "", options.timeframe));
            }
            context = engine.buildMarketContext(references);
        }

        std::optional<analytics::CandleSeries> companion;
        if (!options.compare_path.empty()) {
            companion = loadSeries(options.compare_path, options.compare_symbol, options.timeframe);
        }

        const auto assessment = engine.analyze(series, context, companion ? &*companion : nullptr);
        std::cout << engine::toJson(assessment).dump(2) << std::endl;

        LOG_INFO("{}: {} (score {:.1f}, regime {})", assessment.symbol,
                 toString(assessment.risk_adjusted_recommendation),
                 assessment.intelligent_score, toString(assessment.regime));
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
