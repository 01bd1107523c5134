#include "risk/RiskFilter.h"
#include "TestBars.h"

#include <iostream>
#include <optional>
#include <string>

using namespace pricelens;
using namespace pricelens::testing;
using pricelens::risk::RiskFilter;

namespace {

TradingSignal buySignal(long long ts, double confidence = 0.8) {
    TradingSignal signal;
    signal.symbol = "TEST";
    signal.signal_type = SignalType::BUY;
    signal.confidence = confidence;
    signal.price = 100.0;
    signal.timestamp = ts;
    signal.reason = "breakout above recent range + uptrend (strong_trend_up)";
    return signal;
}

MarketContext context(double volatility, VolumeProfile volume = VolumeProfile::NORMAL) {
    MarketContext m;
    m.symbol = "TEST";
    m.current_price = 100.0;
    m.trend = MarketTrend::UPTREND;
    m.volatility = volatility;
    m.volume_profile = volume;
    return m;
}

} // namespace

int main() {
    RiskFilter filter;

    {
        const auto decision = filter.evaluate(std::nullopt, context(2.0), std::nullopt);
        if (decision.signal || decision.reason || decision.adjusted) {
            std::cerr << "[TEST] null candidate should give an empty decision\n";
            return 1;
        }
    }

    // 변동성 5% 초과
    {
        const auto decision = filter.evaluate(buySignal(kBaseTs), context(5.1), std::nullopt);
        if (decision.signal || !decision.reason || *decision.reason != "volatility_high") {
            std::cerr << "[TEST] volatility above 5 should be rejected as volatility_high\n";
            return 1;
        }
        const auto edge = filter.evaluate(buySignal(kBaseTs), context(5.0), std::nullopt);
        if (!edge.accepted()) {
            std::cerr << "[TEST] volatility exactly 5 should pass\n";
            return 1;
        }
    }

    // 저거래량 할인
    {
        const auto decision = filter.evaluate(buySignal(kBaseTs, 0.8), context(2.0, VolumeProfile::LOW), std::nullopt);
        if (!decision.signal || !decision.adjusted) {
            std::cerr << "[TEST] low volume signal should pass adjusted\n";
            return 1;
        }
        if (!near(decision.signal->confidence, 0.56, 1e-9)) {
            std::cerr << "[TEST] low volume confidence should be 0.56, got " << decision.signal->confidence << "\n";
            return 1;
        }
        const std::string marker = " (low volume)";
        const auto& reason = decision.signal->reason;
        if (reason.size() < marker.size() || reason.compare(reason.size() - marker.size(), marker.size(), marker) != 0) {
            std::cerr << "[TEST] low volume marker missing: " << reason << "\n";
            return 1;
        }

        // 이미 표시된 사유에는 다시 붙이지 않음
        auto marked = buySignal(kBaseTs);
        marked.reason += marker;
        const auto again = filter.evaluate(marked, context(2.0, VolumeProfile::LOW), std::nullopt);
        if (!again.signal || again.signal->reason != marked.reason) {
            std::cerr << "[TEST] low volume marker should not be appended twice\n";
            return 1;
        }
    }

    // 중복 신호 쿨다운
    {
        const auto last = buySignal(kBaseTs);

        const auto early = filter.evaluate(buySignal(kBaseTs + 299000), context(2.0), last);
        if (early.signal || !early.reason || *early.reason != "duplicate_signal") {
            std::cerr << "[TEST] same-type signal within 300s should be rejected\n";
            return 1;
        }

        const auto late = filter.evaluate(buySignal(kBaseTs + 300000), context(2.0), last);
        if (!late.accepted()) {
            std::cerr << "[TEST] same-type signal at 300s should pass\n";
            return 1;
        }

        auto sell = buySignal(kBaseTs + 10000);
        sell.signal_type = SignalType::SELL;
        if (!filter.evaluate(sell, context(2.0), last).accepted()) {
            std::cerr << "[TEST] opposite-type signal should not be throttled\n";
            return 1;
        }

        // 저거래량 보정 후에도 중복이면 거절
        const auto low_dup = filter.evaluate(buySignal(kBaseTs + 1000), context(2.0, VolumeProfile::LOW), last);
        if (!low_dup.rejected() || low_dup.adjusted) {
            std::cerr << "[TEST] duplicate after volume discount should still be rejected\n";
            return 1;
        }
    }

    std::cout << "[TEST] RiskFilter PASSED\n";
    return 0;
}
