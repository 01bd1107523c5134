#pragma once

namespace pricelens {
namespace risk {

// 고정 비율 리스크 사이징
// 손절 시 손실 = 자본 * risk_per_trade 가 되도록 자본 대비 비중 산출 (최대 1.0)
class PositionSizer {
public:
    explicit PositionSizer(double default_risk = 0.02);

    double calculatePositionSize(double entry_price, double stop_loss, double risk_per_trade) const;
    double calculatePositionSize(double entry_price, double stop_loss) const {
        return calculatePositionSize(entry_price, stop_loss, default_risk_);
    }

    double defaultRisk() const { return default_risk_; }

private:
    double default_risk_;
};

} // namespace risk
} // namespace pricelens
