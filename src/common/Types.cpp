#include "common/Types.h"

namespace pricelens {

const char* toString(SignalType type) {
    switch (type) {
        case SignalType::BUY: return "BUY";
        case SignalType::SELL: return "SELL";
        case SignalType::HOLD: return "HOLD";
    }
    return "HOLD";
}

const char* toString(MarketTrend trend) {
    switch (trend) {
        case MarketTrend::UPTREND: return "UPTREND";
        case MarketTrend::DOWNTREND: return "DOWNTREND";
        case MarketTrend::SIDEWAYS: return "SIDEWAYS";
        case MarketTrend::BREAKOUT: return "BREAKOUT";
        case MarketTrend::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(VolumeProfile profile) {
    switch (profile) {
        case VolumeProfile::HIGH: return "HIGH";
        case VolumeProfile::NORMAL: return "NORMAL";
        case VolumeProfile::LOW: return "LOW";
        case VolumeProfile::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* toString(SignalPattern pattern) {
    switch (pattern) {
        case SignalPattern::NONE: return "none";
        case SignalPattern::RANGE_BREAKOUT: return "range_breakout";
        case SignalPattern::TWO_LEG_PULLBACK: return "two_leg_pullback";
        case SignalPattern::WEDGE_BREAKOUT: return "wedge_breakout";
        case SignalPattern::TRENDLINE_BREAK: return "trendline_break";
        case SignalPattern::FAILED_BREAKOUT: return "failed_breakout";
        case SignalPattern::KEY_LEVEL_TEST: return "key_level_test";
        case SignalPattern::REVERSAL_BAR: return "reversal_bar";
    }
    return "none";
}

} // namespace pricelens
