#pragma once

#include "common/Types.h"
#include "engine/PipelineConfig.h"
#include <optional>
#include <string>

namespace pricelens {
namespace risk {

// 거절 사유
constexpr const char* kRejectVolatilityHigh = "volatility_high";
constexpr const char* kRejectDuplicateSignal = "duplicate_signal";

struct RiskDecision {
    std::optional<TradingSignal> signal;    // 통과한 신호 (보정 포함)
    std::optional<std::string> reason;      // 거절 사유
    bool adjusted = false;                  // 신뢰도 보정 여부

    bool accepted() const { return signal.has_value(); }
    bool rejected() const { return !signal && reason.has_value(); }
};

// 신호 필터: 변동성 차단 -> 저거래량 할인 -> 중복 신호 제한 (순서 고정)
class RiskFilter {
public:
    explicit RiskFilter(const engine::RiskFilterConfig& config = engine::RiskFilterConfig());

    RiskDecision evaluate(
        const std::optional<TradingSignal>& candidate,
        const MarketContext& market,
        const std::optional<TradingSignal>& last_signal
    ) const;

private:
    engine::RiskFilterConfig config_;
};

} // namespace risk
} // namespace pricelens
