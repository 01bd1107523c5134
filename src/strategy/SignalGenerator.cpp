#include "strategy/SignalGenerator.h"
#include "common/Logger.h"
#include <algorithm>

namespace pricelens {
namespace strategy {

using analytics::BarQuality;
using analytics::ConsecutivePattern;
using analytics::KeyLevelType;
using analytics::MarketStructure;
using analytics::PatternDirection;
using analytics::PriceActionContext;
using analytics::WedgeType;

namespace {

const char* trendLabel(MarketTrend trend) {
    switch (trend) {
        case MarketTrend::UPTREND: return "uptrend";
        case MarketTrend::DOWNTREND: return "downtrend";
        case MarketTrend::SIDEWAYS: return "range";
        case MarketTrend::BREAKOUT: return "breakout attempt";
        case MarketTrend::UNKNOWN: break;
    }
    return "unknown trend";
}

} // namespace

SignalGenerator::SignalGenerator(const engine::SignalConfig& config)
    : config_(config) {
}

std::optional<TradingSignal> SignalGenerator::generate(
    const PriceActionContext& context,
    const MarketContext& market,
    const std::vector<Bar>& window
) const {
    if (window.empty()) {
        return std::nullopt;
    }

    const Bar& bar = window.back();
    std::optional<TradingSignal> signal = fromRangeBreakout(context, market);
    if (!signal) signal = fromPullback(context, market);
    if (!signal) signal = fromWedge(context, market);
    if (!signal) signal = fromTrendline(context, market);
    if (!signal) signal = fromFailedBreakout(context, market);
    if (!signal) signal = fromKeyLevelTest(context, market, bar);
    if (!signal) signal = fromReversal(context, market);

    if (!signal) {
        return std::nullopt;
    }

    signal->timestamp = bar.timestamp;
    signal->stop_loss = protectiveStop(signal->signal_type, window);

    LOG_DEBUG("[SignalGenerator] {} {} candidate conf={:.2f} ({})",
              context.symbol, toString(signal->signal_type), signal->confidence, signal->reason);
    return signal;
}

double SignalGenerator::protectiveStop(SignalType type, const std::vector<Bar>& window) const {
    if (window.empty()) return 0.0;

    const std::size_t lookback = static_cast<std::size_t>(std::max(config_.stop_lookback, 1));
    const std::size_t start = window.size() > lookback ? window.size() - lookback : 0;

    double stop = type == SignalType::SELL ? window[start].high : window[start].low;
    for (std::size_t i = start; i < window.size(); ++i) {
        stop = type == SignalType::SELL ? std::max(stop, window[i].high) : std::min(stop, window[i].low);
    }
    return stop;
}

std::optional<TradingSignal> SignalGenerator::fromRangeBreakout(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    if (!context.range_breakout) return std::nullopt;

    const bool volume_ok = market.volume_profile == VolumeProfile::HIGH ||
                           market.volume_profile == VolumeProfile::NORMAL;
    if (!volume_ok || market.volatility <= config_.breakout_min_volatility) {
        return std::nullopt;
    }

    const bool ranging = market.trend == MarketTrend::SIDEWAYS || market.trend == MarketTrend::BREAKOUT;

    if (context.range_breakout->direction == PatternDirection::BULLISH) {
        if (market.trend == MarketTrend::UPTREND) {
            return makeSignal(SignalType::BUY, config_.breakout_aligned_confidence, SignalPattern::RANGE_BREAKOUT,
                              "breakout above recent range", context, market);
        }
        if (ranging) {
            return makeSignal(SignalType::BUY, config_.breakout_range_confidence, SignalPattern::RANGE_BREAKOUT,
                              "breakout above recent range", context, market);
        }
        return std::nullopt;
    }

    if (market.trend == MarketTrend::DOWNTREND) {
        return makeSignal(SignalType::SELL, config_.breakout_aligned_confidence, SignalPattern::RANGE_BREAKOUT,
                          "breakout below recent range", context, market);
    }
    if (ranging) {
        return makeSignal(SignalType::SELL, config_.breakout_range_confidence, SignalPattern::RANGE_BREAKOUT,
                          "breakout below recent range", context, market);
    }
    return std::nullopt;
}

// 역추세 눌림목은 무시
std::optional<TradingSignal> SignalGenerator::fromPullback(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    if (!context.two_leg_pullback) return std::nullopt;

    if (context.two_leg_pullback->direction == PatternDirection::BULLISH) {
        if (market.trend == MarketTrend::DOWNTREND) return std::nullopt;
        return makeSignal(SignalType::BUY, config_.pullback_confidence, SignalPattern::TWO_LEG_PULLBACK,
                          "two-leg pullback higher low", context, market);
    }

    if (market.trend == MarketTrend::UPTREND) return std::nullopt;
    return makeSignal(SignalType::SELL, config_.pullback_confidence, SignalPattern::TWO_LEG_PULLBACK,
                      "two-leg pullback lower high", context, market);
}

std::optional<TradingSignal> SignalGenerator::fromWedge(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    if (!context.wedge_pattern || context.wedge_pattern->type != WedgeType::CONVERGING) {
        return std::nullopt;
    }

    const auto& wedge = *context.wedge_pattern;
    if (context.current_price > wedge.upper_line) {
        return makeSignal(SignalType::BUY, config_.wedge_confidence, SignalPattern::WEDGE_BREAKOUT,
                          "converging wedge breakout up", context, market);
    }
    if (context.current_price < wedge.lower_line) {
        return makeSignal(SignalType::SELL, config_.wedge_confidence, SignalPattern::WEDGE_BREAKOUT,
                          "converging wedge breakout down", context, market);
    }
    return std::nullopt;
}

std::optional<TradingSignal> SignalGenerator::fromTrendline(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    if (!context.trendline_break) return std::nullopt;

    if (context.trendline_break->direction == PatternDirection::BULLISH) {
        return makeSignal(SignalType::BUY, config_.trendline_confidence, SignalPattern::TRENDLINE_BREAK,
                          "down trendline broken", context, market);
    }
    return makeSignal(SignalType::SELL, config_.trendline_confidence, SignalPattern::TRENDLINE_BREAK,
                      "up trendline broken", context, market);
}

std::optional<TradingSignal> SignalGenerator::fromFailedBreakout(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    if (!context.failed_breakout) return std::nullopt;

    if (context.failed_breakout->direction == PatternDirection::BULLISH) {
        return makeSignal(SignalType::BUY, config_.failed_breakout_confidence, SignalPattern::FAILED_BREAKOUT,
                          "failed breakdown below support", context, market);
    }
    return makeSignal(SignalType::SELL, config_.failed_breakout_confidence, SignalPattern::FAILED_BREAKOUT,
                      "failed breakout above resistance", context, market);
}

std::optional<TradingSignal> SignalGenerator::fromKeyLevelTest(
    const PriceActionContext& context,
    const MarketContext& market,
    const Bar& bar
) const {
    if (!context.test_pattern) return std::nullopt;

    const auto& test = *context.test_pattern;
    const double confidence = test.strong ? config_.key_level_strong_confidence : config_.key_level_confidence;

    if (test.level_type == KeyLevelType::SUPPORT && bar.close > bar.open) {
        return makeSignal(SignalType::BUY, confidence, SignalPattern::KEY_LEVEL_TEST,
                          test.strong ? "strong support test" : "support test", context, market);
    }
    if (test.level_type == KeyLevelType::RESISTANCE && bar.close < bar.open) {
        return makeSignal(SignalType::SELL, confidence, SignalPattern::KEY_LEVEL_TEST,
                          test.strong ? "strong resistance test" : "resistance test", context, market);
    }
    return std::nullopt;
}

std::optional<TradingSignal> SignalGenerator::fromReversal(
    const PriceActionContext& context,
    const MarketContext& market
) const {
    const bool reversal_bar = context.barQuality() == BarQuality::REVERSAL && context.bar.reversal_direction;
    const bool bullish = (reversal_bar && *context.bar.reversal_direction == PatternDirection::BULLISH) ||
                         context.consecutive_pattern == ConsecutivePattern::CONSECUTIVE_BULL;
    const bool bearish = (reversal_bar && *context.bar.reversal_direction == PatternDirection::BEARISH) ||
                         context.consecutive_pattern == ConsecutivePattern::CONSECUTIVE_BEAR;

    if (bullish && context.market_structure == MarketStructure::STRONG_TREND_DOWN) {
        return makeSignal(SignalType::BUY, config_.reversal_confidence, SignalPattern::REVERSAL_BAR,
                          "bullish reversal", context, market);
    }
    if (bearish && context.market_structure == MarketStructure::STRONG_TREND_UP) {
        return makeSignal(SignalType::SELL, config_.reversal_confidence, SignalPattern::REVERSAL_BAR,
                          "bearish reversal", context, market);
    }
    return std::nullopt;
}

// reason = "<패턴> + <추세> (<구조>)"
TradingSignal SignalGenerator::makeSignal(
    SignalType type,
    double confidence,
    SignalPattern pattern,
    const std::string& description,
    const PriceActionContext& context,
    const MarketContext& market
) {
    TradingSignal signal;
    signal.symbol = context.symbol;
    signal.signal_type = type;
    signal.confidence = std::clamp(confidence, 0.0, 1.0);
    signal.price = context.current_price;
    signal.pattern = pattern;
    signal.reason = description + " + " + trendLabel(market.trend) +
                    " (" + analytics::toString(context.market_structure) + ")";
    return signal;
}

} // namespace strategy
} // namespace pricelens
