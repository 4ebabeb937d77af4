#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace marketlens {
namespace analytics {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}

bool TechnicalIndicators::isDefined(double value) {
    return !std::isnan(value);
}

// EMA (adjusted weights): y_t = sum((1-a)^k * x_{t-k}) / sum((1-a)^k)
std::vector<double> TechnicalIndicators::calculateEMASeries(const std::vector<double>& values, int span) {
    std::vector<double> ema(values.size(), kNaN);
    if (values.empty() || span < 1) return ema;

    const double alpha = 2.0 / (span + 1.0);
    const double decay = 1.0 - alpha;

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        weighted_sum = values[i] + decay * weighted_sum;
        weight_total = 1.0 + decay * weight_total;
        ema[i] = weighted_sum / weight_total;
    }

    return ema;
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window < 1) return out;

    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < values.size(); ++i) {
        const size_t begin = i + 1 - w;
        if (!windowDefined(values, begin, i + 1)) continue;
        out[i] = calculateMean(values, begin, i + 1);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStd(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window < 2) return out;

    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < values.size(); ++i) {
        const size_t begin = i + 1 - w;
        if (!windowDefined(values, begin, i + 1)) continue;
        const double mean = calculateMean(values, begin, i + 1);
        out[i] = calculateStandardDeviation(values, begin, i + 1, mean);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMaxCentered(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window < 1) return out;

    const size_t before = static_cast<size_t>(window / 2);
    const size_t after = static_cast<size_t>((window - 1) / 2);
    for (size_t i = before; i + after < values.size(); ++i) {
        const size_t begin = i - before;
        const size_t end = i + after + 1;
        if (!windowDefined(values, begin, end)) continue;
        out[i] = *std::max_element(values.begin() + begin, values.begin() + end);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMinCentered(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), kNaN);
    if (window < 1) return out;

    const size_t before = static_cast<size_t>(window / 2);
    const size_t after = static_cast<size_t>((window - 1) / 2);
    for (size_t i = before; i + after < values.size(); ++i) {
        const size_t begin = i - before;
        const size_t end = i + after + 1;
        if (!windowDefined(values, begin, end)) continue;
        out[i] = *std::min_element(values.begin() + begin, values.begin() + end);
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateTrueRange(const std::vector<Candle>& candles) {
    std::vector<double> tr_values;
    tr_values.reserve(candles.size());

    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& current = candles[i];
        if (i == 0) {
            tr_values.push_back(current.high - current.low);
            continue;
        }
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    return tr_values;
}

std::vector<double> TechnicalIndicators::calculateATRSeries(const std::vector<Candle>& candles, int period) {
    return rollingMean(calculateTrueRange(candles), period);
}

std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    std::vector<double> rsi(prices.size(), kNaN);
    if (period < 1 || prices.size() < static_cast<size_t>(period)) {
        return rsi;
    }

    std::vector<double> gains(prices.size(), 0.0);
    std::vector<double> losses(prices.size(), 0.0);
    for (size_t i = 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) gains[i] = change;
        else losses[i] = -change;
    }

    // The first candle has no delta and counts as zero movement
    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < prices.size(); ++i) {
        const double avg_gain = calculateMean(gains, i + 1 - p, i + 1);
        const double avg_loss = calculateMean(losses, i + 1 - p, i + 1);

        if (avg_loss <= 0.0) {
            rsi[i] = (avg_gain > 0.0) ? 100.0 : 50.0;
            continue;
        }
        double rs = avg_gain / avg_loss;
        rsi[i] = 100.0 - (100.0 / (1.0 + rs));
    }

    return rsi;
}

std::vector<double> TechnicalIndicators::calculateBollingerWidthSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    std::vector<double> width(prices.size(), kNaN);
    auto middle = rollingMean(prices, period);
    auto std_dev = rollingStd(prices, period);

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!isDefined(middle[i]) || !isDefined(std_dev[i]) || middle[i] == 0.0) continue;
        double upper = middle[i] + std_dev[i] * std_dev_mult;
        double lower = middle[i] - std_dev[i] * std_dev_mult;
        width[i] = ((upper - lower) / middle[i]) * 100.0;
    }
    return width;
}

// VWAP (Volume Weighted Average Price)
std::optional<double> TechnicalIndicators::calculateVWAP(const std::vector<Candle>& candles, size_t begin) {
    double cumulative_tpv = 0.0;
    double cumulative_volume = 0.0;

    for (size_t i = begin; i < candles.size(); ++i) {
        const auto& candle = candles[i];
        double typical_price = (candle.high + candle.low + candle.close) / 3.0;
        cumulative_tpv += typical_price * candle.volume;
        cumulative_volume += candle.volume;
    }

    if (cumulative_volume <= 0.0) return std::nullopt;
    return cumulative_tpv / cumulative_volume;
}

double TechnicalIndicators::pearsonCorrelation(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size() || a.size() < 2) return 0.0;

    const double mean_a = calculateMean(a, 0, a.size());
    const double mean_b = calculateMean(b, 0, b.size());

    double cov = 0.0;
    double var_a = 0.0;
    double var_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double da = a[i] - mean_a;
        const double db = b[i] - mean_b;
        cov += da * db;
        var_a += da * da;
        var_b += db * db;
    }

    if (var_a <= 0.0 || var_b <= 0.0) return 0.0;

    const double r = cov / std::sqrt(var_a * var_b);
    if (!std::isfinite(r)) return 0.0;
    return std::clamp(r, -1.0, 1.0);
}

std::vector<double> TechnicalIndicators::extractOpenPrices(const std::vector<Candle>& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) out.push_back(candle.open);
    return out;
}

std::vector<double> TechnicalIndicators::extractHighPrices(const std::vector<Candle>& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) out.push_back(candle.high);
    return out;
}

std::vector<double> TechnicalIndicators::extractLowPrices(const std::vector<Candle>& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) out.push_back(candle.low);
    return out;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) out.push_back(candle.volume);
    return out;
}

// ========== Private helpers ==========

double TechnicalIndicators::calculateMean(const std::vector<double>& values, size_t begin, size_t end) {
    if (end <= begin) return 0.0;
    return std::accumulate(values.begin() + begin, values.begin() + end, 0.0) / (end - begin);
}

// Sample standard deviation (n - 1)
double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    size_t begin,
    size_t end,
    double mean
) {
    if (end - begin < 2) return 0.0;
    double sum_sq_diff = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum_sq_diff += (values[i] - mean) * (values[i] - mean);
    }
    return std::sqrt(sum_sq_diff / (end - begin - 1));
}

bool TechnicalIndicators::windowDefined(const std::vector<double>& values, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        if (std::isnan(values[i])) return false;
    }
    return true;
}

} // namespace analytics
} // namespace marketlens
