#include "analytics/BarQualityClassifier.h"
#include <algorithm>
#include <cmath>

namespace pricelens {
namespace analytics {

namespace {
constexpr double kDojiBodyRatio = 0.1;
constexpr double kReversalBodyRatio = 0.3;
constexpr double kStrongBodyRatio = 0.7;
constexpr double kStrongShadowRatio = 0.2;
constexpr std::size_t kReversalTrendBars = 3;
}

BarQualityAnalysis BarQualityClassifier::analyze(const std::vector<Bar>& window) const {
    BarQualityAnalysis result;
    if (window.empty()) {
        return result;
    }

    const Bar& bar = window.back();
    const double body = std::abs(bar.close - bar.open);
    const double range = bar.high - bar.low;

    // 고가 == 저가: 비율 계산 불가
    if (range <= 0.0) {
        return result;
    }

    const bool bullish = bar.close > bar.open;
    const double upper = bullish ? bar.high - bar.close : bar.high - bar.open;
    const double lower = bullish ? bar.open - bar.low : bar.close - bar.low;

    result.body_ratio = body / range;
    result.upper_shadow_ratio = upper / range;
    result.lower_shadow_ratio = lower / range;

    if (result.body_ratio < kDojiBodyRatio) {
        result.quality = BarQuality::DOJI;
        return result;
    }

    const double lower_wick = std::min(bar.open, bar.close) - bar.low;
    const double upper_wick = bar.high - std::max(bar.open, bar.close);

    // 망치형: 하락 흐름 끝의 긴 아래꼬리
    if (lower_wick > 2.0 * body && result.body_ratio < kReversalBodyRatio &&
        closesFalling(window, kReversalTrendBars)) {
        result.quality = BarQuality::REVERSAL;
        result.reversal_direction = PatternDirection::BULLISH;
        return result;
    }

    // 유성형
    if (upper_wick > 2.0 * body && result.body_ratio < kReversalBodyRatio &&
        closesRising(window, kReversalTrendBars)) {
        result.quality = BarQuality::REVERSAL;
        result.reversal_direction = PatternDirection::BEARISH;
        return result;
    }

    if (bullish) {
        result.quality = (result.body_ratio > kStrongBodyRatio &&
                          result.upper_shadow_ratio < kStrongShadowRatio)
            ? BarQuality::STRONG_BULL : BarQuality::WEAK_BULL;
    } else {
        result.quality = (result.body_ratio > kStrongBodyRatio &&
                          result.lower_shadow_ratio < kStrongShadowRatio)
            ? BarQuality::STRONG_BEAR : BarQuality::WEAK_BEAR;
    }

    return result;
}

bool BarQualityClassifier::closesFalling(const std::vector<Bar>& window, std::size_t count) {
    if (window.size() < count || count < 2) return false;
    for (std::size_t i = window.size() - count + 1; i < window.size(); ++i) {
        if (!(window[i].close < window[i - 1].close)) return false;
    }
    return true;
}

bool BarQualityClassifier::closesRising(const std::vector<Bar>& window, std::size_t count) {
    if (window.size() < count || count < 2) return false;
    for (std::size_t i = window.size() - count + 1; i < window.size(); ++i) {
        if (!(window[i].close > window[i - 1].close)) return false;
    }
    return true;
}

} // namespace analytics
} // namespace pricelens
