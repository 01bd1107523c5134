#include "analytics/StructureClassifier.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace pricelens {
namespace analytics {

namespace {
constexpr std::size_t kMinBars = 5;
constexpr std::size_t kSimplifiedLimit = 10;
constexpr std::size_t kStrengthLookback = 10;
}

StructureClassifier::StructureClassifier(const engine::StructureConfig& config)
    : config_(config) {
}

StructureAnalysis StructureClassifier::analyze(const std::vector<Bar>& window) const {
    StructureAnalysis result;
    result.method = "insufficient";

    if (window.size() < kMinBars) {
        return result;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(window);

    if (window.size() < kSimplifiedLimit) {
        result = analyzeSimplified(closes);
    } else if (window.size() < static_cast<std::size_t>(config_.lookback)) {
        result = analyzeEma(closes);
    } else {
        result = analyzeSwings(window);
        if (result.method.empty()) {
            result = analyzeEma(closes);
        }
    }

    if (result.structure == MarketStructure::TRADING_RANGE && isBreakoutAttempt(window)) {
        result.structure = MarketStructure::BREAKOUT_ATTEMPT;
    }

    return result;
}

StructureAnalysis StructureClassifier::analyzeSimplified(const std::vector<double>& closes) const {
    StructureAnalysis result;
    result.method = "simplified";

    const double mean = TechnicalIndicators::calculateMean(closes);
    if (mean <= 0.0) return result;

    const double deviation = (closes.back() - mean) / mean;
    if (deviation > config_.simplified_deviation_threshold) {
        result.structure = MarketStructure::WEAK_TREND_UP;
        result.trend_strength = std::min(std::abs(deviation) * 10.0, 1.0);
    } else if (deviation < -config_.simplified_deviation_threshold) {
        result.structure = MarketStructure::WEAK_TREND_DOWN;
        result.trend_strength = std::min(std::abs(deviation) * 10.0, 1.0);
    }
    return result;
}

// 최근 lookback 봉의 고점/저점 비교. 판단 불가면 method 를 비워서 반환
StructureAnalysis StructureClassifier::analyzeSwings(const std::vector<Bar>& window) const {
    StructureAnalysis result;

    const std::size_t lookback = static_cast<std::size_t>(config_.lookback);
    const auto highs = TechnicalIndicators::tail(TechnicalIndicators::extractHighs(window), lookback);
    const auto lows = TechnicalIndicators::tail(TechnicalIndicators::extractLows(window), lookback);

    const auto peaks = TechnicalIndicators::findLocalPeaks(highs, config_.peak_window);
    const auto valleys = TechnicalIndicators::findLocalValleys(lows, config_.peak_window);
    if (peaks.size() < 2 || valleys.size() < 2) {
        return result;
    }

    const double last_peak = highs[peaks[peaks.size() - 1]];
    const double prev_peak = highs[peaks[peaks.size() - 2]];
    const double last_valley = lows[valleys[valleys.size() - 1]];
    const double prev_valley = lows[valleys[valleys.size() - 2]];

    const bool higher_highs = last_peak > prev_peak;
    const bool higher_lows = last_valley > prev_valley;
    const bool lower_highs = last_peak < prev_peak;
    const bool lower_lows = last_valley < prev_valley;

    if (!(higher_highs && higher_lows) && !(lower_highs && lower_lows)) {
        return result;
    }

    const double range = *std::max_element(highs.begin(), highs.end()) -
                         *std::min_element(lows.begin(), lows.end());
    const double last_close = window.back().close;
    const double ref_close = window[window.size() - kStrengthLookback].close;
    const double strength = range > 0.0
        ? std::min(std::abs(last_close - ref_close) / range, 1.0)
        : 0.0;

    const bool strong = strength > config_.strong_threshold;
    if (higher_highs && higher_lows) {
        result.structure = strong ? MarketStructure::STRONG_TREND_UP : MarketStructure::WEAK_TREND_UP;
    } else {
        result.structure = strong ? MarketStructure::STRONG_TREND_DOWN : MarketStructure::WEAK_TREND_DOWN;
    }
    result.trend_strength = strength;
    result.method = "swing";
    return result;
}

StructureAnalysis StructureClassifier::analyzeEma(const std::vector<double>& closes) const {
    StructureAnalysis result;
    result.method = "ema";

    const auto ema = TechnicalIndicators::calculateEMASeries(closes, config_.ema_period);
    if (ema.empty()) return result;

    // close-EMA 부호가 자주 바뀌면 횡보
    const std::size_t n = closes.size();
    const std::size_t span = std::min(n, static_cast<std::size_t>(config_.crossing_lookback));
    int crossings = 0;
    for (std::size_t i = n - span + 1; i < n; ++i) {
        const bool above_prev = closes[i - 1] - ema[i - 1] > 0.0;
        const bool above_now = closes[i] - ema[i] > 0.0;
        if (above_prev != above_now) ++crossings;
    }
    if (crossings >= config_.range_crossings) {
        return result;
    }

    const double current_ema = ema.back();
    if (current_ema <= 0.0) return result;

    const double deviation = (closes.back() - current_ema) / current_ema;
    const double strength = std::min(std::abs(deviation) * 10.0, 1.0);
    const bool strong = strength > config_.ema_strong_threshold;

    if (deviation > config_.ema_deviation_threshold) {
        result.structure = strong ? MarketStructure::STRONG_TREND_UP : MarketStructure::WEAK_TREND_UP;
        result.trend_strength = strength;
    } else if (deviation < -config_.ema_deviation_threshold) {
        result.structure = strong ? MarketStructure::STRONG_TREND_DOWN : MarketStructure::WEAK_TREND_DOWN;
        result.trend_strength = strength;
    }
    return result;
}

// 횡보 판정 상태에서 직전 19봉 극값을 종가가 넘으면 돌파 시도
bool StructureClassifier::isBreakoutAttempt(const std::vector<Bar>& window) const {
    const std::size_t lookback = static_cast<std::size_t>(config_.lookback);
    if (window.size() < lookback) return false;

    double prior_high = window[window.size() - lookback].high;
    double prior_low = window[window.size() - lookback].low;
    for (std::size_t i = window.size() - lookback; i + 1 < window.size(); ++i) {
        prior_high = std::max(prior_high, window[i].high);
        prior_low = std::min(prior_low, window[i].low);
    }

    const double close = window.back().close;
    return close > prior_high || close < prior_low;
}

} // namespace analytics
} // namespace pricelens
