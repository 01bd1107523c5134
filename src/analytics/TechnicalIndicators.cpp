#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <numeric>

namespace pricelens {
namespace analytics {

// EMA 계열 계산 (adjust=false 방식)
std::vector<double> TechnicalIndicators::calculateEMASeries(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (prices.empty() || period <= 0) return ema_values;

    const double multiplier = 2.0 / (period + 1.0);
    ema_values.reserve(prices.size());

    double ema = prices.front();
    ema_values.push_back(ema);
    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

// SMA 계산 (Simple Moving Average)
double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

std::vector<size_t> TechnicalIndicators::findLocalPeaks(const std::vector<double>& values, int window) {
    std::vector<size_t> peaks;
    if (window <= 0 || values.size() < static_cast<size_t>(window * 2 + 1)) return peaks;

    for (size_t i = window; i < values.size() - window; ++i) {
        if (isLocalMaximum(values, i, window)) {
            peaks.push_back(i);
        }
    }
    return peaks;
}

std::vector<size_t> TechnicalIndicators::findLocalValleys(const std::vector<double>& values, int window) {
    std::vector<size_t> valleys;
    if (window <= 0 || values.size() < static_cast<size_t>(window * 2 + 1)) return valleys;

    for (size_t i = window; i < values.size() - window; ++i) {
        if (isLocalMinimum(values, i, window)) {
            valleys.push_back(i);
        }
    }
    return valleys;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractHighs(const std::vector<Bar>& bars) {
    std::vector<double> highs;
    highs.reserve(bars.size());
    for (const auto& bar : bars) {
        highs.push_back(bar.high);
    }
    return highs;
}

std::vector<double> TechnicalIndicators::extractLows(const std::vector<Bar>& bars) {
    std::vector<double> lows;
    lows.reserve(bars.size());
    for (const auto& bar : bars) {
        lows.push_back(bar.low);
    }
    return lows;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Bar>& bars) {
    std::vector<double> volumes;
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.volume);
    }
    return volumes;
}

std::vector<double> TechnicalIndicators::tail(const std::vector<double>& values, size_t count) {
    const size_t n = std::min(count, values.size());
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(n), values.end());
}

// ========== Private 헬퍼 함수들 ==========

bool TechnicalIndicators::isLocalMaximum(
    const std::vector<double>& values,
    size_t index,
    int window
) {
    const double value = values[index];
    for (int j = 1; j <= window; ++j) {
        if (values[index - j] > value) return false;
        if (values[index + j] > value) return false;
    }
    return true;
}

bool TechnicalIndicators::isLocalMinimum(
    const std::vector<double>& values,
    size_t index,
    int window
) {
    const double value = values[index];
    for (int j = 1; j <= window; ++j) {
        if (values[index - j] < value) return false;
        if (values[index + j] < value) return false;
    }
    return true;
}

} // namespace analytics
} // namespace pricelens
