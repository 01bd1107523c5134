#pragma once

#include "common/Types.h"
#include <cstddef>
#include <optional>
#include <string>

namespace pricelens {
namespace analytics {

// K-line 품질
enum class BarQuality {
    STRONG_BULL,
    WEAK_BULL,
    STRONG_BEAR,
    WEAK_BEAR,
    DOJI,
    REVERSAL
};

enum class MarketStructure {
    STRONG_TREND_UP,
    WEAK_TREND_UP,
    STRONG_TREND_DOWN,
    WEAK_TREND_DOWN,
    TRADING_RANGE,
    BREAKOUT_ATTEMPT
};

enum class PatternDirection { BULLISH, BEARISH };

enum class KeyLevelType { SUPPORT, RESISTANCE };

enum class WedgeType { CONVERGING, DIVERGING };

enum class ConsecutivePattern { CONSECUTIVE_BULL, CONSECUTIVE_BEAR, THREE_BULL, THREE_BEAR };

struct BarQualityAnalysis {
    BarQuality quality = BarQuality::DOJI;
    double body_ratio = 0.0;
    double upper_shadow_ratio = 0.0;
    double lower_shadow_ratio = 0.0;
    // REVERSAL 일 때만 의미 있음 (망치형 = BULLISH, 유성형 = BEARISH)
    std::optional<PatternDirection> reversal_direction;
};

struct StructureAnalysis {
    MarketStructure structure = MarketStructure::TRADING_RANGE;
    double trend_strength = 0.0;    // 0 ~ 1
    std::string method;             // "swing", "ema", "simplified", "insufficient"
};

// 윈도우 내 인덱스 기준 스윙 포인트
struct SwingPoint {
    std::size_t index = 0;
    double price = 0.0;
};

struct RangeBreakout {
    PatternDirection direction = PatternDirection::BULLISH;
    double level = 0.0;             // 돌파한 직전 고가/저가
};

struct TwoLegPullback {
    PatternDirection direction = PatternDirection::BULLISH;
    SwingPoint first_leg;
    SwingPoint second_leg;
    double strength = 0.0;
};

struct WedgePattern {
    WedgeType type = WedgeType::CONVERGING;
    double upper_slope = 0.0;       // 봉당 가격 변화
    double lower_slope = 0.0;
    double upper_line = 0.0;        // 현재 봉 위치로 연장한 상단선
    double lower_line = 0.0;
    double range = 0.0;
};

struct TestPattern {
    KeyLevelType level_type = KeyLevelType::SUPPORT;
    double level = 0.0;
    int hits = 0;
    bool strong = false;
};

struct TrendlineBreak {
    PatternDirection direction = PatternDirection::BEARISH;
    double projected_price = 0.0;
    double strength = 0.0;
};

struct FailedBreakout {
    PatternDirection direction = PatternDirection::BEARISH;   // 반전 방향
    double level = 0.0;
    double penetration = 0.0;       // 돌파 폭 (비율)
    std::size_t bars_since_penetration = 0;
};

struct KeyLevelFlag {
    bool at_key_level = false;
    std::optional<KeyLevelType> level_type;
};

// 봉마다 새로 계산, 이후 수정하지 않음
struct PriceActionContext {
    std::string symbol;
    double current_price = 0.0;
    BarQualityAnalysis bar;
    MarketStructure market_structure = MarketStructure::TRADING_RANGE;
    double trend_strength = 0.0;
    bool at_key_level = false;
    std::optional<KeyLevelType> key_level_type;
    std::optional<ConsecutivePattern> consecutive_pattern;
    std::optional<RangeBreakout> range_breakout;
    std::optional<TwoLegPullback> two_leg_pullback;
    std::optional<WedgePattern> wedge_pattern;
    std::optional<TestPattern> test_pattern;
    std::optional<TrendlineBreak> trendline_break;
    std::optional<FailedBreakout> failed_breakout;

    BarQuality barQuality() const { return bar.quality; }
};

const char* toString(BarQuality quality);
const char* toString(MarketStructure structure);
const char* toString(PatternDirection direction);
const char* toString(KeyLevelType type);
const char* toString(WedgeType type);
const char* toString(ConsecutivePattern pattern);

bool isUptrend(MarketStructure structure);
bool isDowntrend(MarketStructure structure);

} // namespace analytics
} // namespace pricelens
