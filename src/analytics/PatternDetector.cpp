#include "analytics/PatternDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace pricelens {
namespace analytics {

namespace {

double priceRange(const std::vector<Bar>& bars) {
    if (bars.empty()) return 0.0;
    double high = bars.front().high;
    double low = bars.front().low;
    for (const auto& bar : bars) {
        high = std::max(high, bar.high);
        low = std::min(low, bar.low);
    }
    return high - low;
}

std::vector<Bar> tailBars(const std::vector<Bar>& window, std::size_t count) {
    const std::size_t n = std::min(count, window.size());
    return std::vector<Bar>(window.end() - static_cast<std::ptrdiff_t>(n), window.end());
}

// 두 스윙을 지나는 직선을 index 위치로 연장
double projectLine(const SwingPoint& first, const SwingPoint& second, std::size_t index, double& slope) {
    const double dx = static_cast<double>(second.index) - static_cast<double>(first.index);
    slope = dx != 0.0 ? (second.price - first.price) / dx : 0.0;
    return second.price + slope * (static_cast<double>(index) - static_cast<double>(second.index));
}

} // namespace

PatternDetector::PatternDetector(
    const engine::PatternConfig& config,
    const engine::StructureConfig& structure_config
)
    : config_(config)
    , structure_config_(structure_config)
    , structure_classifier_(structure_config) {
}

std::vector<SwingPoint> PatternDetector::findSwingHighs(const std::vector<Bar>& window, int distance) const {
    std::vector<SwingPoint> swings;
    if (distance <= 0) return swings;

    const std::size_t d = static_cast<std::size_t>(distance);
    if (window.size() < d * 2 + 1) return swings;

    for (std::size_t i = d; i + d < window.size(); ++i) {
        const double high = window[i].high;
        bool is_swing = true;
        for (std::size_t j = i - d; j < i && is_swing; ++j) {
            if (window[j].high >= high) is_swing = false;
        }
        for (std::size_t j = i + 1; j <= i + d && is_swing; ++j) {
            if (window[j].high > high) is_swing = false;
        }
        if (is_swing) {
            swings.push_back({i, high});
        }
    }
    return swings;
}

std::vector<SwingPoint> PatternDetector::findSwingLows(const std::vector<Bar>& window, int distance) const {
    std::vector<SwingPoint> swings;
    if (distance <= 0) return swings;

    const std::size_t d = static_cast<std::size_t>(distance);
    if (window.size() < d * 2 + 1) return swings;

    for (std::size_t i = d; i + d < window.size(); ++i) {
        const double low = window[i].low;
        bool is_swing = true;
        for (std::size_t j = i - d; j < i && is_swing; ++j) {
            if (window[j].low <= low) is_swing = false;
        }
        for (std::size_t j = i + 1; j <= i + d && is_swing; ++j) {
            if (window[j].low < low) is_swing = false;
        }
        if (is_swing) {
            swings.push_back({i, low});
        }
    }
    return swings;
}

// 직전 N봉 (현재 봉 제외) 고가/저가 돌파
std::optional<RangeBreakout> PatternDetector::detectRangeBreakout(const std::vector<Bar>& window) const {
    const std::size_t lookback = static_cast<std::size_t>(std::max(config_.breakout_lookback, 1));
    if (window.size() < lookback + 1) return std::nullopt;

    const std::size_t end = window.size() - 1;
    double prior_high = window[end - lookback].high;
    double prior_low = window[end - lookback].low;
    for (std::size_t i = end - lookback; i < end; ++i) {
        prior_high = std::max(prior_high, window[i].high);
        prior_low = std::min(prior_low, window[i].low);
    }

    const double close = window.back().close;
    if (close > prior_high) {
        return RangeBreakout{PatternDirection::BULLISH, prior_high};
    }
    if (close < prior_low) {
        return RangeBreakout{PatternDirection::BEARISH, prior_low};
    }
    return std::nullopt;
}

std::optional<TwoLegPullback> PatternDetector::detectTwoLegPullback(const std::vector<Bar>& window) const {
    if (window.empty()) return std::nullopt;
    const double close = window.back().close;

    // 상승: 더 높은 저점 이후 반등
    const auto lows = findSwingLows(window, config_.swing_distance);
    if (lows.size() >= 2) {
        const SwingPoint& first = lows[lows.size() - 2];
        const SwingPoint& second = lows[lows.size() - 1];
        if (second.price > first.price && second.price > 0.0) {
            const double rebound = (close - second.price) / second.price;
            if (rebound >= config_.pullback_min_rebound) {
                return TwoLegPullback{PatternDirection::BULLISH, first, second, std::min(rebound, 1.0)};
            }
        }
    }

    // 하락: 더 낮은 고점 이후 재하락
    const auto highs = findSwingHighs(window, config_.swing_distance);
    if (highs.size() >= 2) {
        const SwingPoint& first = highs[highs.size() - 2];
        const SwingPoint& second = highs[highs.size() - 1];
        if (second.price < first.price && second.price > 0.0) {
            const double decline = (second.price - close) / second.price;
            if (decline >= config_.pullback_min_rebound) {
                return TwoLegPullback{PatternDirection::BEARISH, first, second, std::min(decline, 1.0)};
            }
        }
    }

    return std::nullopt;
}

std::optional<WedgePattern> PatternDetector::detectWedge(const std::vector<Bar>& window) const {
    const std::size_t lookback = static_cast<std::size_t>(std::max(config_.wedge_lookback, 1));
    if (window.size() < lookback) return std::nullopt;

    const auto recent = tailBars(window, lookback);
    const auto highs = findSwingHighs(recent, config_.wedge_swing_distance);
    const auto lows = findSwingLows(recent, config_.wedge_swing_distance);
    if (highs.size() < 3 || lows.size() < 3) return std::nullopt;

    const double range = priceRange(recent);
    if (range <= 0.0) return std::nullopt;

    const std::size_t current = recent.size() - 1;
    WedgePattern wedge;
    wedge.range = range;
    wedge.upper_line = projectLine(highs[highs.size() - 2], highs.back(), current, wedge.upper_slope);
    wedge.lower_line = projectLine(lows[lows.size() - 2], lows.back(), current, wedge.lower_slope);

    const double magnitude = std::abs(wedge.upper_slope) + std::abs(wedge.lower_slope);

    if (wedge.upper_slope < 0.0 && wedge.lower_slope > 0.0 &&
        magnitude > range * config_.wedge_converging_min_ratio) {
        wedge.type = WedgeType::CONVERGING;
        return wedge;
    }
    if (wedge.upper_slope > 0.0 && wedge.lower_slope < 0.0 &&
        magnitude > range * config_.wedge_diverging_min_ratio) {
        wedge.type = WedgeType::DIVERGING;
        return wedge;
    }
    return std::nullopt;
}

std::optional<TestPattern> PatternDetector::detectKeyLevelTest(const std::vector<Bar>& window) const {
    if (window.empty()) return std::nullopt;

    const double close = window.back().close;
    const double tolerance = config_.key_level_tolerance;

    std::vector<SwingPoint> swings = findSwingHighs(window, config_.swing_distance);
    const auto lows = findSwingLows(window, config_.swing_distance);
    swings.insert(swings.end(), lows.begin(), lows.end());
    if (swings.empty()) return std::nullopt;

    const std::size_t lookback = static_cast<std::size_t>(std::max(config_.key_level_lookback, 1));
    const std::size_t recent_start = window.size() > lookback ? window.size() - lookback : 0;

    std::optional<TestPattern> best;
    for (const auto& candidate : swings) {
        if (candidate.index < recent_start || candidate.price <= 0.0) continue;
        const double level = candidate.price;
        if (std::abs(close - level) / level > tolerance) continue;

        int hits = 0;
        for (const auto& point : swings) {
            if (std::abs(point.price - level) / level <= tolerance) {
                ++hits;
            }
        }
        if (hits < config_.key_level_min_hits) continue;
        if (best && hits <= best->hits) continue;

        TestPattern pattern;
        pattern.level = level;
        pattern.hits = hits;
        pattern.strong = hits >= config_.key_level_strong_hits;
        pattern.level_type = close >= level ? KeyLevelType::SUPPORT : KeyLevelType::RESISTANCE;
        best = pattern;
    }
    return best;
}

std::optional<TrendlineBreak> PatternDetector::detectTrendlineBreak(const std::vector<Bar>& window) const {
    if (window.empty()) return std::nullopt;

    const double close = window.back().close;
    const std::size_t current = window.size() - 1;
    std::optional<TrendlineBreak> bearish;
    std::optional<TrendlineBreak> bullish;

    // 상승 추세선 (저점 상승) 하향 이탈
    const auto lows = findSwingLows(window, config_.swing_distance);
    if (lows.size() >= 2 && lows.back().price > lows[lows.size() - 2].price) {
        double slope = 0.0;
        const double projected = projectLine(lows[lows.size() - 2], lows.back(), current, slope);
        if (projected > 0.0) {
            const double distance = (projected - close) / projected;
            if (distance >= config_.trendline_break_threshold) {
                bearish = TrendlineBreak{PatternDirection::BEARISH, projected, std::min(distance, 1.0)};
            }
        }
    }

    // 하락 추세선 (고점 하락) 상향 돌파
    const auto highs = findSwingHighs(window, config_.swing_distance);
    if (highs.size() >= 2 && highs.back().price < highs[highs.size() - 2].price) {
        double slope = 0.0;
        const double projected = projectLine(highs[highs.size() - 2], highs.back(), current, slope);
        if (projected > 0.0) {
            const double distance = (close - projected) / projected;
            if (distance >= config_.trendline_break_threshold) {
                bullish = TrendlineBreak{PatternDirection::BULLISH, projected, std::min(distance, 1.0)};
            }
        }
    }

    if (bearish && bullish) {
        return bullish->strength > bearish->strength ? bullish : bearish;
    }
    return bearish ? bearish : bullish;
}

std::optional<FailedBreakout> PatternDetector::detectFailedBreakout(const std::vector<Bar>& window) const {
    const auto highs = findSwingHighs(window, config_.swing_distance);
    for (auto it = highs.rbegin(); it != highs.rend(); ++it) {
        auto result = checkFailedBreakout(window, *it, true);
        if (result) return result;
    }

    const auto lows = findSwingLows(window, config_.swing_distance);
    for (auto it = lows.rbegin(); it != lows.rend(); ++it) {
        auto result = checkFailedBreakout(window, *it, false);
        if (result) return result;
    }
    return std::nullopt;
}

// above=true: 저항 위로 살짝 돌파 후 되돌림 (하락 반전)
std::optional<FailedBreakout> PatternDetector::checkFailedBreakout(
    const std::vector<Bar>& window,
    const SwingPoint& swing,
    bool above
) const {
    const std::size_t lookback = static_cast<std::size_t>(std::max(config_.failed_breakout_lookback, 1));
    const double level = swing.price;
    if (level <= 0.0 || window.size() <= lookback) return std::nullopt;

    const std::size_t start = window.size() - lookback;
    if (swing.index >= start) return std::nullopt;

    double max_penetration = 0.0;
    std::optional<std::size_t> last_penetration;
    for (std::size_t i = start; i < window.size(); ++i) {
        const double penetration = above
            ? (window[i].high - level) / level
            : (level - window[i].low) / level;
        max_penetration = std::max(max_penetration, penetration);
        if (penetration >= config_.failed_breakout_min_penetration) {
            last_penetration = i;
        }
    }

    // 돌파 폭이 너무 크면 진짜 돌파
    if (!last_penetration || max_penetration > config_.failed_breakout_max_penetration) {
        return std::nullopt;
    }

    const std::size_t bars_since = window.size() - 1 - *last_penetration;
    if (bars_since > static_cast<std::size_t>(config_.failed_breakout_reversal_bars)) {
        return std::nullopt;
    }

    const double close = window.back().close;
    const double reversal = above ? (level - close) / level : (close - level) / level;
    if (reversal < config_.failed_breakout_min_reversal) {
        return std::nullopt;
    }

    FailedBreakout result;
    result.direction = above ? PatternDirection::BEARISH : PatternDirection::BULLISH;
    result.level = level;
    result.penetration = max_penetration;
    result.bars_since_penetration = bars_since;
    return result;
}

KeyLevelFlag PatternDetector::detectKeyLevel(const std::vector<Bar>& window) const {
    KeyLevelFlag flag;
    const std::size_t lookback = static_cast<std::size_t>(std::max(structure_config_.lookback, 1));
    if (window.size() < lookback) return flag;

    const auto recent = tailBars(window, lookback);
    const auto highs = TechnicalIndicators::extractHighs(recent);
    const auto lows = TechnicalIndicators::extractLows(recent);

    const double tolerance = priceRange(recent) * config_.key_level_tolerance;
    if (tolerance <= 0.0) return flag;

    const double close = window.back().close;
    for (std::size_t idx : TechnicalIndicators::findLocalPeaks(highs, structure_config_.peak_window)) {
        if (std::abs(close - highs[idx]) <= tolerance) {
            flag.at_key_level = true;
            flag.level_type = KeyLevelType::RESISTANCE;
            return flag;
        }
    }
    for (std::size_t idx : TechnicalIndicators::findLocalValleys(lows, structure_config_.peak_window)) {
        if (std::abs(close - lows[idx]) <= tolerance) {
            flag.at_key_level = true;
            flag.level_type = KeyLevelType::SUPPORT;
            return flag;
        }
    }
    return flag;
}

std::optional<ConsecutivePattern> PatternDetector::detectConsecutive(const std::vector<Bar>& window) const {
    if (window.size() < 5) return std::nullopt;

    const auto closes = TechnicalIndicators::tail(TechnicalIndicators::extractClosePrices(window), 5);

    bool rising = true;
    bool falling = true;
    for (std::size_t i = 1; i < closes.size(); ++i) {
        rising = rising && closes[i] > closes[i - 1];
        falling = falling && closes[i] < closes[i - 1];
    }
    if (rising) return ConsecutivePattern::CONSECUTIVE_BULL;
    if (falling) return ConsecutivePattern::CONSECUTIVE_BEAR;

    // 최근 3개 종가
    if (closes[2] < closes[3] && closes[3] < closes[4]) return ConsecutivePattern::THREE_BULL;
    if (closes[2] > closes[3] && closes[3] > closes[4]) return ConsecutivePattern::THREE_BEAR;
    return std::nullopt;
}

PriceActionContext PatternDetector::buildContext(
    const std::string& symbol,
    const std::vector<Bar>& window
) const {
    PriceActionContext context;
    context.symbol = symbol;
    if (window.empty()) {
        return context;
    }

    context.current_price = window.back().close;
    context.bar = bar_classifier_.analyze(window);

    const auto structure = structure_classifier_.analyze(window);
    context.market_structure = structure.structure;
    context.trend_strength = structure.trend_strength;

    const auto key_level = detectKeyLevel(window);
    context.at_key_level = key_level.at_key_level;
    context.key_level_type = key_level.level_type;

    context.consecutive_pattern = detectConsecutive(window);
    context.range_breakout = detectRangeBreakout(window);
    context.two_leg_pullback = detectTwoLegPullback(window);
    context.wedge_pattern = detectWedge(window);
    context.test_pattern = detectKeyLevelTest(window);
    context.trendline_break = detectTrendlineBreak(window);
    context.failed_breakout = detectFailedBreakout(window);
    return context;
}

} // namespace analytics
} // namespace pricelens
