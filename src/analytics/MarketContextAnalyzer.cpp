#include "analytics/MarketContextAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include <algorithm>

namespace pricelens {
namespace analytics {

namespace {
constexpr double kTrendVolatilityScale = 3.0;
constexpr double kStrongBarFactor = 1.2;
constexpr double kDojiFactor = 0.7;
constexpr double kReversalFactor = 1.5;
constexpr double kKeyLevelFactor = 1.3;
constexpr double kMaxVolatility = 10.0;
}

MarketContextAnalyzer::MarketContextAnalyzer(const engine::PipelineConfig& config)
    : volume_average_period_(config.volume_average_period)
    , high_volume_ratio_(config.high_volume_ratio)
    , low_volume_ratio_(config.low_volume_ratio) {
}

MarketContext MarketContextAnalyzer::analyze(
    const PriceActionContext& context,
    const std::vector<Bar>& window
) const {
    MarketContext market;
    market.symbol = context.symbol;
    market.current_price = context.current_price;
    market.trend = mapTrend(context.market_structure);
    market.volatility = estimateVolatility(context);
    market.volume_profile = classifyVolume(window);
    return market;
}

MarketTrend MarketContextAnalyzer::mapTrend(MarketStructure structure) {
    switch (structure) {
        case MarketStructure::STRONG_TREND_UP:
        case MarketStructure::WEAK_TREND_UP:
            return MarketTrend::UPTREND;
        case MarketStructure::STRONG_TREND_DOWN:
        case MarketStructure::WEAK_TREND_DOWN:
            return MarketTrend::DOWNTREND;
        case MarketStructure::TRADING_RANGE:
            return MarketTrend::SIDEWAYS;
        case MarketStructure::BREAKOUT_ATTEMPT:
            return MarketTrend::BREAKOUT;
    }
    return MarketTrend::UNKNOWN;
}

// 추세 강도 기반 추정치. 봉 형태와 주요 레벨 근접 여부로 보정
double MarketContextAnalyzer::estimateVolatility(const PriceActionContext& context) const {
    double volatility = context.trend_strength * kTrendVolatilityScale;

    switch (context.barQuality()) {
        case BarQuality::STRONG_BULL:
        case BarQuality::STRONG_BEAR:
            volatility *= kStrongBarFactor;
            break;
        case BarQuality::DOJI:
            volatility *= kDojiFactor;
            break;
        case BarQuality::REVERSAL:
            volatility *= kReversalFactor;
            break;
        default:
            break;
    }

    if (context.at_key_level) {
        volatility *= kKeyLevelFactor;
    }

    return std::min(volatility, kMaxVolatility);
}

VolumeProfile MarketContextAnalyzer::classifyVolume(const std::vector<Bar>& window) const {
    if (volume_average_period_ <= 0 ||
        window.size() < static_cast<std::size_t>(volume_average_period_)) {
        return VolumeProfile::UNKNOWN;
    }

    const double average = TechnicalIndicators::calculateSMA(
        TechnicalIndicators::extractVolumes(window), volume_average_period_);
    if (average <= 0.0) {
        return VolumeProfile::UNKNOWN;
    }

    const double ratio = window.back().volume / average;
    if (ratio > high_volume_ratio_) return VolumeProfile::HIGH;
    if (ratio < low_volume_ratio_) return VolumeProfile::LOW;
    return VolumeProfile::NORMAL;
}

} // namespace analytics
} // namespace pricelens
