#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace marketlens {
namespace data {

// File-backed candle supply. Rows are returned as read; CandleSeries::create validates them.
class CandleLoader {
public:
    // timestamp,open,high,low,close,volume
    // Header and malformed rows (including cells with trailing junk) are skipped. Throws std::runtime_error if the file cannot be opened.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Array of objects ({timestamp|t, open|o, high|h, low|l, close|c, volume|v}) or
    // Binance kline arrays ([open_time, "o", "h", "l", "c", "v", ...]), in file order.
    // Throws std::runtime_error if the file cannot be opened or parsed.
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Dispatch on extension (.json => loadJSON, otherwise loadCSV)
    static std::vector<Candle> load(const std::string& file_path);
};

} // namespace data
} // namespace marketlens
