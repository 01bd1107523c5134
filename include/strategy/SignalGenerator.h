#pragma once

#include "analytics/PriceActionTypes.h"
#include "common/Types.h"
#include "engine/PipelineConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace pricelens {
namespace strategy {

// 패턴 결과를 봉당 최대 1개의 신호로 결정
// 우선순위 (먼저 맞는 것 채택):
//   1. 최근 범위 돌파      2. 2-leg 눌림목      3. 수렴 쐐기 돌파
//   4. 추세선 이탈         5. 돌파 실패         6. 주요 레벨 테스트
//   7. 반전 봉
class SignalGenerator {
public:
    explicit SignalGenerator(const engine::SignalConfig& config = engine::SignalConfig());

    std::optional<TradingSignal> generate(
        const analytics::PriceActionContext& context,
        const MarketContext& market,
        const std::vector<Bar>& window
    ) const;

    // BUY: 최근 N봉 최저가, SELL: 최근 N봉 최고가
    double protectiveStop(SignalType type, const std::vector<Bar>& window) const;

private:
    std::optional<TradingSignal> fromRangeBreakout(const analytics::PriceActionContext& context, const MarketContext& market) const;
    std::optional<TradingSignal> fromPullback(const analytics::PriceActionContext& context, const MarketContext& market) const;
    std::optional<TradingSignal> fromWedge(const analytics::PriceActionContext& context, const MarketContext& market) const;
    std::optional<TradingSignal> fromTrendline(const analytics::PriceActionContext& context, const MarketContext& market) const;
    std::optional<TradingSignal> fromFailedBreakout(const analytics::PriceActionContext& context, const MarketContext& market) const;
    std::optional<TradingSignal> fromKeyLevelTest(const analytics::PriceActionContext& context, const MarketContext& market, const Bar& bar) const;
    std::optional<TradingSignal> fromReversal(const analytics::PriceActionContext& context, const MarketContext& market) const;

    static TradingSignal makeSignal(
        SignalType type,
        double confidence,
        SignalPattern pattern,
        const std::string& description,
        const analytics::PriceActionContext& context,
        const MarketContext& market
    );

    engine::SignalConfig config_;
};

} // namespace strategy
} // namespace pricelens
