#pragma once

#include <memory>
#include <string>
#include <vector>
#include "common/Types.h"

namespace marketlens {
namespace analytics {

// Immutable OHLCV sequence for one symbol/timeframe plus the derived series every
// component reads. Copies share the same frozen data, so concurrent readers need no locking.
class CandleSeries {
public:
    static constexpr int kEmaFast = 9;
    static constexpr int kEmaMid = 21;
    static constexpr int kEmaSlow = 50;
    static constexpr int kAtrPeriod = 14;
    static constexpr int kRsiPeriod = 14;
    static constexpr int kBollingerPeriod = 20;
    static constexpr int kVolumePeriod = 20;

    // Validates and freezes. Throws InvalidInputError on a non-finite value, a price <= 0,
    // negative volume, high < low, or timestamps that are not strictly ascending.
    static CandleSeries create(std::string symbol, std::string timeframe, std::vector<Candle> candles);

    // Most recent `count` candles (whole series when count >= size)
    CandleSeries tail(size_t count) const;

    const std::string& symbol() const { return data_->symbol; }
    const std::string& timeframe() const { return data_->timeframe; }

    size_t size() const { return data_->candles.size(); }
    bool empty() const { return data_->candles.empty(); }
    const Candle& operator[](size_t index) const { return data_->candles[index]; }
    const Candle& back() const { return data_->candles.back(); }
    const std::vector<Candle>& candles() const { return data_->candles; }

    const std::vector<double>& opens() const { return data_->opens; }
    const std::vector<double>& highs() const { return data_->highs; }
    const std::vector<double>& lows() const { return data_->lows; }
    const std::vector<double>& closes() const { return data_->closes; }
    const std::vector<double>& volumes() const { return data_->volumes; }

    // Derived, index-aligned with candles(); undefined leading entries are NaN
    const std::vector<double>& ema9() const { return data_->ema9; }
    const std::vector<double>& ema21() const { return data_->ema21; }
    const std::vector<double>& ema50() const { return data_->ema50; }
    const std::vector<double>& atr14() const { return data_->atr14; }
    const std::vector<double>& rsi14() const { return data_->rsi14; }
    const std::vector<double>& bollingerWidth20() const { return data_->bb_width20; }
    const std::vector<double>& volumeSma20() const { return data_->volume_sma20; }

private:
    struct Data {
        std::string symbol;
        std::string timeframe;
        std::vector<Candle> candles;

        std::vector<double> opens;
        std::vector<double> highs;
        std::vector<double> lows;
        std::vector<double> closes;
        std::vector<double> volumes;

        std::vector<double> ema9;
        std::vector<double> ema21;
        std::vector<double> ema50;
        std::vector<double> atr14;
        std::vector<double> rsi14;
        std::vector<double> bb_width20;
        std::vector<double> volume_sma20;
    };

    explicit CandleSeries(std::shared_ptr<const Data> data) : data_(std::move(data)) {}

    static void validate(const std::vector<Candle>& candles);
    static std::shared_ptr<const Data> build(std::string symbol, std::string timeframe,
                                             std::vector<Candle> candles);

    std::shared_ptr<const Data> data_;
};

} // namespace analytics
} // namespace marketlens
