#include "data/CandleLoader.h"
#include "common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace marketlens {
namespace data {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// The whole cell must be consumed: "101.5abc" is not 101.5
double parseDouble(const std::string& text) {
    size_t pos = 0;
    const double value = std::stod(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters in '" + text + "'");
    }
    return value;
}

TimestampMs parseTimestamp(const std::string& text) {
    size_t pos = 0;
    const TimestampMs value = std::stoll(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters in '" + text + "'");
    }
    return value;
}

// Kline fields arrive as strings, object fields as numbers or strings
double toDouble(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseDouble(value.get<std::string>());
    }
    return value.get<double>();
}

TimestampMs toTimestamp(const nlohmann::json& value) {
    if (value.is_string()) {
        return parseTimestamp(value.get<std::string>());
    }
    if (value.is_number_float()) {
        return static_cast<TimestampMs>(value.get<double>());
    }
    return value.get<TimestampMs>();
}

const nlohmann::json& field(const nlohmann::json& item, const char* name, const char* short_name) {
    if (item.contains(name)) {
        return item.at(name);
    }
    if (item.contains(short_name)) {
        return item.at(short_name);
    }
    throw std::runtime_error(std::string("missing field '") + name + "'");
}

Candle candleFromJson(const nlohmann::json& item) {
    Candle candle;
    if (item.is_array()) {
        if (item.size() < 6) {
            throw std::runtime_error("kline array needs at least 6 entries");
        }
        candle.timestamp = toTimestamp(item[0]);
        candle.open = toDouble(item[1]);
        candle.high = toDouble(item[2]);
        candle.low = toDouble(item[3]);
        candle.close = toDouble(item[4]);
        candle.volume = toDouble(item[5]);
        return candle;
    }
    if (!item.is_object()) {
        throw std::runtime_error("candle must be an object or an array");
    }
    candle.timestamp = toTimestamp(field(item, "timestamp", "t"));
    candle.open = toDouble(field(item, "open", "o"));
    candle.high = toDouble(field(item, "high", "h"));
    candle.low = toDouble(field(item, "low", "l"));
    candle.close = toDouble(field(item, "close", "c"));
    candle.volume = toDouble(field(item, "volume", "v"));
    return candle;
}

} // namespace

std::vector<Candle> CandleLoader::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open CSV file: " + file_path);
    }

    std::vector<Candle> candles;
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;
        if (row[0].empty() ||
            (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-')) {
            if (line_no > 1) {
                LOG_WARN("Skipping malformed row {} in {}", line_no, file_path);
            }
            continue;
        }
        if (row.size() < 6) {
            LOG_WARN("Skipping short row {} in {} ({} cells)", line_no, file_path, row.size());
            continue;
        }

        try {
            candles.emplace_back(parseDouble(row[1]), parseDouble(row[2]), parseDouble(row[3]),
                                 parseDouble(row[4]), parseDouble(row[5]), parseTimestamp(row[0]));
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row {} in {}: {}", line_no, file_path, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> CandleLoader::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error("Error parsing JSON file: " + file_path + " - " + e.what());
    }
    if (!j.is_array()) {
        throw std::runtime_error("JSON candle file must hold an array: " + file_path);
    }

    std::vector<Candle> candles;
    candles.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        try {
            candles.push_back(candleFromJson(j[i]));
        } catch (const std::exception& e) {
            LOG_WARN("Skipping candle #{} in {}: {}", i, file_path, e.what());
        }
    }

    LOG_INFO("Loaded {} candles from {}", candles.size(), file_path);
    return candles;
}

std::vector<Candle> CandleLoader::load(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

} // namespace data
} // namespace marketlens
