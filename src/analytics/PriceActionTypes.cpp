#include "analytics/PriceActionTypes.h"

namespace pricelens {
namespace analytics {

const char* toString(BarQuality quality) {
    switch (quality) {
        case BarQuality::STRONG_BULL: return "strong_bull";
        case BarQuality::WEAK_BULL: return "weak_bull";
        case BarQuality::STRONG_BEAR: return "strong_bear";
        case BarQuality::WEAK_BEAR: return "weak_bear";
        case BarQuality::DOJI: return "doji";
        case BarQuality::REVERSAL: return "reversal";
    }
    return "doji";
}

const char* toString(MarketStructure structure) {
    switch (structure) {
        case MarketStructure::STRONG_TREND_UP: return "strong_trend_up";
        case MarketStructure::WEAK_TREND_UP: return "weak_trend_up";
        case MarketStructure::STRONG_TREND_DOWN: return "strong_trend_down";
        case MarketStructure::WEAK_TREND_DOWN: return "weak_trend_down";
        case MarketStructure::TRADING_RANGE: return "trading_range";
        case MarketStructure::BREAKOUT_ATTEMPT: return "breakout_attempt";
    }
    return "trading_range";
}

const char* toString(PatternDirection direction) {
    return direction == PatternDirection::BULLISH ? "bullish" : "bearish";
}

const char* toString(KeyLevelType type) {
    return type == KeyLevelType::SUPPORT ? "support" : "resistance";
}

const char* toString(WedgeType type) {
    return type == WedgeType::CONVERGING ? "converging" : "diverging";
}

const char* toString(ConsecutivePattern pattern) {
    switch (pattern) {
        case ConsecutivePattern::CONSECUTIVE_BULL: return "consecutive_bull";
        case ConsecutivePattern::CONSECUTIVE_BEAR: return "consecutive_bear";
        case ConsecutivePattern::THREE_BULL: return "three_bull";
        case ConsecutivePattern::THREE_BEAR: return "three_bear";
    }
    return "three_bull";
}

bool isUptrend(MarketStructure structure) {
    return structure == MarketStructure::STRONG_TREND_UP ||
           structure == MarketStructure::WEAK_TREND_UP;
}

bool isDowntrend(MarketStructure structure) {
    return structure == MarketStructure::STRONG_TREND_DOWN ||
           structure == MarketStructure::WEAK_TREND_DOWN;
}

} // namespace analytics
} // namespace pricelens
