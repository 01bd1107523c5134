#include "execution/OrderPlanner.h"
#include "common/Logger.h"
#include <cmath>

namespace pricelens {
namespace execution {

const char* toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "BUY";
        case OrderSide::SELL: return "SELL";
        case OrderSide::NONE: return "NONE";
    }
    return "NONE";
}

OrderPlanner::OrderPlanner(const engine::SizingConfig& config)
    : config_(config)
    , sizer_(config.risk_per_trade) {
}

OrderPlan OrderPlanner::plan(const TradingSignal& signal, double equity, double held_quantity) const {
    OrderPlan plan;
    plan.symbol = signal.symbol;

    if (signal.confidence < config_.min_execution_confidence) {
        plan.reason = "confidence below execution threshold";
        LOG_DEBUG("[OrderPlanner] {} skipped, confidence {:.2f} < {:.2f}",
                  signal.symbol, signal.confidence, config_.min_execution_confidence);
        return plan;
    }

    if (!std::isfinite(signal.price) || signal.price <= 0.0) {
        plan.reason = "invalid signal price";
        LOG_WARN("[OrderPlanner] {} invalid signal price {}", signal.symbol, signal.price);
        return plan;
    }

    const double held = held_quantity > 0.0 ? held_quantity : 0.0;

    switch (signal.signal_type) {
        case SignalType::BUY: {
            plan.target_fraction = sizer_.calculatePositionSize(signal.price, signal.stop_loss);
            if (equity <= 0.0 || plan.target_fraction <= 0.0) {
                plan.reason = "no target position";
                return plan;
            }

            const double target_quantity = equity * plan.target_fraction / signal.price;
            const double shortfall = target_quantity - held;
            if (shortfall <= 0.0) {
                plan.reason = "already at target";
                return plan;
            }

            plan.side = OrderSide::BUY;
            plan.quantity = shortfall;
            plan.reason = signal.reason;
            return plan;
        }
        case SignalType::SELL: {
            if (held <= 0.0) {
                plan.reason = "no position to close";
                return plan;
            }
            plan.side = OrderSide::SELL;
            plan.quantity = held;
            plan.reason = signal.reason;
            return plan;
        }
        case SignalType::HOLD:
            break;
    }

    LOG_WARN("[OrderPlanner] {} unsupported signal type {}, no order",
             signal.symbol, pricelens::toString(signal.signal_type));
    plan.reason = "unsupported signal type";
    return plan;
}

} // namespace execution
} // namespace pricelens
