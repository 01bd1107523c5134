#pragma once

#include <cstddef>
#include <string>

namespace pricelens {
namespace engine {

// 시장 구조 분류 설정
struct StructureConfig {
    int peak_window = 2;                        // peak/valley 좌우 비교 폭
    int lookback = 20;                          // 고점/저점 탐색 구간
    int ema_period = 20;
    int crossing_lookback = 10;                 // close-EMA 부호 변화 확인 구간
    int range_crossings = 3;                    // 이 이상 교차하면 횡보
    double strong_threshold = 0.6;              // 고점/저점 방식 STRONG 기준
    double ema_strong_threshold = 0.5;          // EMA 방식 STRONG 기준
    double ema_deviation_threshold = 0.001;     // 0.1%
    double simplified_deviation_threshold = 0.002; // 0.2% (10봉 미만)
};

// 패턴 탐지 설정
struct PatternConfig {
    int swing_distance = 5;
    int breakout_lookback = 5;
    int wedge_lookback = 15;
    int wedge_swing_distance = 2;
    double wedge_converging_min_ratio = 0.01;
    double wedge_diverging_min_ratio = 0.015;
    double pullback_min_rebound = 0.005;
    int key_level_lookback = 20;
    double key_level_tolerance = 0.005;
    int key_level_min_hits = 2;
    int key_level_strong_hits = 3;
    double trendline_break_threshold = 0.005;
    int failed_breakout_lookback = 5;
    int failed_breakout_reversal_bars = 3;
    double failed_breakout_min_penetration = 0.001;
    double failed_breakout_max_penetration = 0.02;
    double failed_breakout_min_reversal = 0.002;
};

// 신호 생성 설정
struct SignalConfig {
    double breakout_min_volatility = 1.0;
    double breakout_aligned_confidence = 0.8;
    double breakout_range_confidence = 0.6;
    double pullback_confidence = 0.75;
    double wedge_confidence = 0.7;
    double trendline_confidence = 0.7;
    double failed_breakout_confidence = 0.7;
    double key_level_confidence = 0.65;
    double key_level_strong_confidence = 0.7;
    double reversal_confidence = 0.7;
    int stop_lookback = 3;
};

// 리스크 필터 설정
struct RiskFilterConfig {
    double max_volatility_pct = 5.0;
    double low_volume_confidence_factor = 0.7;
    int duplicate_cooldown_sec = 300;
    std::string low_volume_marker = " (low volume)";
};

// 포지션 사이징 / 주문 변환 설정
struct SizingConfig {
    double risk_per_trade = 0.02;
    double min_execution_confidence = 0.6;
};

struct PipelineConfig {
    std::size_t buffer_size = 1000;
    std::size_t analysis_bars = 50;             // 분석에 사용하는 최근 봉 수
    std::size_t min_bars_for_signal = 20;
    int volume_average_period = 10;
    double high_volume_ratio = 1.5;
    double low_volume_ratio = 0.5;

    StructureConfig structure;
    PatternConfig patterns;
    SignalConfig signals;
    RiskFilterConfig risk;
    SizingConfig sizing;

    // 잘못된 값이면 std::invalid_argument
    void validate() const;
};

} // namespace engine
} // namespace pricelens
