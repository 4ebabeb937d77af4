#include "analytics/CandleSeries.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <cmath>
#include <cstddef>
#include <sstream>

namespace marketlens {
namespace analytics {

namespace {
std::string describe(size_t index, const std::string& problem) {
    std::ostringstream oss;
    oss << "candle #" << index << ": " << problem;
    return oss.str();
}
}

CandleSeries CandleSeries::create(std::string symbol, std::string timeframe, std::vector<Candle> candles) {
    validate(candles);
    return CandleSeries(build(std::move(symbol), std::move(timeframe), std::move(candles)));
}

CandleSeries CandleSeries::tail(size_t count) const {
    if (count >= size()) {
        return *this;
    }
    std::vector<Candle> recent(data_->candles.end() - static_cast<std::ptrdiff_t>(count),
                               data_->candles.end());
    // already validated; derived series are recomputed over the shorter window
    return CandleSeries(build(data_->symbol, data_->timeframe, std::move(recent)));
}

void CandleSeries::validate(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];

        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) ||
            !std::isfinite(c.close) || !std::isfinite(c.volume)) {
            throw InvalidInputError(describe(i, "non-finite value"));
        }
        if (c.open <= 0.0 || c.high <= 0.0 || c.low <= 0.0 || c.close <= 0.0) {
            throw InvalidInputError(describe(i, "price must be positive"));
        }
        if (c.volume < 0.0) {
            throw InvalidInputError(describe(i, "negative volume"));
        }
        if (c.high < c.low) {
            throw InvalidInputError(describe(i, "high below low"));
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            throw InvalidInputError(describe(i, "timestamp not strictly ascending ("
                + std::to_string(candles[i - 1].timestamp) + " -> "
                + std::to_string(c.timestamp) + ")"));
        }
    }
}

std::shared_ptr<const CandleSeries::Data> CandleSeries::build(
    std::string symbol,
    std::string timeframe,
    std::vector<Candle> candles
) {
    auto data = std::make_shared<Data>();
    data->symbol = std::move(symbol);
    data->timeframe = std::move(timeframe);
    data->candles = std::move(candles);

    const auto& c = data->candles;
    data->opens = TechnicalIndicators::extractOpenPrices(c);
    data->highs = TechnicalIndicators::extractHighPrices(c);
    data->lows = TechnicalIndicators::extractLowPrices(c);
    data->closes = TechnicalIndicators::extractClosePrices(c);
    data->volumes = TechnicalIndicators::extractVolumes(c);

    data->ema9 = TechnicalIndicators::calculateEMASeries(data->closes, kEmaFast);
    data->ema21 = TechnicalIndicators::calculateEMASeries(data->closes, kEmaMid);
    data->ema50 = TechnicalIndicators::calculateEMASeries(data->closes, kEmaSlow);
    data->atr14 = TechnicalIndicators::calculateATRSeries(c, kAtrPeriod);
    data->rsi14 = TechnicalIndicators::calculateRSISeries(data->closes, kRsiPeriod);
    data->bb_width20 = TechnicalIndicators::calculateBollingerWidthSeries(data->closes, kBollingerPeriod);
    data->volume_sma20 = TechnicalIndicators::rollingMean(data->volumes, kVolumePeriod);

    return data;
}

} // namespace analytics
} // namespace marketlens
