#pragma once

#include "common/Types.h"
#include "engine/PipelineConfig.h"
#include "risk/PositionSizer.h"
#include <string>

namespace pricelens {
namespace execution {

enum class OrderSide { BUY, SELL, NONE };

const char* toString(OrderSide side);

// 신호 + 목표 비중 -> 실제로 거래할 차이분
struct OrderPlan {
    std::string symbol;
    OrderSide side = OrderSide::NONE;
    double quantity = 0.0;
    double target_fraction = 0.0;   // 자본 대비 목표 비중
    std::string reason;

    bool actionable() const { return side != OrderSide::NONE && quantity > 0.0; }
};

// BUY: 목표 보유량 대비 부족분만 매수 (이미 목표 이상이면 없음)
// SELL: 보유 전량 청산 (공매도 없음)
class OrderPlanner {
public:
    explicit OrderPlanner(const engine::SizingConfig& config = engine::SizingConfig());

    OrderPlan plan(const TradingSignal& signal, double equity, double held_quantity) const;

private:
    engine::SizingConfig config_;
    risk::PositionSizer sizer_;
};

} // namespace execution
} // namespace pricelens
