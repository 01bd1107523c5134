#include "risk/PositionSizer.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace pricelens {
namespace risk {

PositionSizer::PositionSizer(double default_risk)
    : default_risk_(default_risk) {
}

double PositionSizer::calculatePositionSize(
    double entry_price,
    double stop_loss,
    double risk_per_trade
) const {
    if (!std::isfinite(entry_price) || !std::isfinite(stop_loss) ||
        entry_price <= 0.0 || stop_loss <= 0.0) {
        LOG_WARN("[PositionSizer] invalid prices entry={} stop={}", entry_price, stop_loss);
        return 0.0;
    }
    if (!(risk_per_trade > 0.0 && risk_per_trade <= 1.0)) {
        LOG_WARN("[PositionSizer] risk_per_trade out of range: {}", risk_per_trade);
        return 0.0;
    }

    // 손절가가 진입가 이상이면 리스크 정의 불가
    const double risk_per_share = entry_price - stop_loss;
    if (risk_per_share <= 0.0) {
        LOG_WARN("[PositionSizer] stop must be below entry: entry={} stop={}", entry_price, stop_loss);
        return 0.0;
    }

    const double risk_fraction = risk_per_share / entry_price;
    return std::min(risk_per_trade / risk_fraction, 1.0);
}

} // namespace risk
} // namespace pricelens
