#pragma once

#include "analytics/MarketContextAnalyzer.h"
#include "analytics/PatternDetector.h"
#include "analytics/RollingWindow.h"
#include "common/Types.h"
#include "core/contracts/IEventSink.h"
#include "engine/PipelineConfig.h"
#include "execution/OrderPlanner.h"
#include "risk/RiskFilter.h"
#include "strategy/SignalGenerator.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pricelens {
namespace engine {

// 심볼 1개의 봉 처리 파이프라인
//  봉 검증 -> 버퍼 추가 -> 패턴/구조 분석 -> 신호 생성 -> 리스크 필터
//
// 락 순서: process_mutex_ -> buffer_mutex_
//  - processNewBar 는 process_mutex_ 로 직렬화 (단일 writer)
//  - 버퍼/최신 체결가는 buffer_mutex_ (읽기는 shared)
//  - 이벤트는 락을 모두 푼 뒤 sink 로 발행. sink 에서 파이프라인 조회 가능
class PriceActionPipeline {
public:
    PriceActionPipeline(
        std::string symbol,
        const PipelineConfig& config = PipelineConfig(),
        std::shared_ptr<core::IEventSink> sink = nullptr,
        const std::vector<Bar>& warmup_bars = {}
    );

    // 예외를 밖으로 던지지 않음. 실패 시 ERROR_OCCURRED 발행 후 신호 없음
    std::optional<TradingSignal> processNewBar(const Bar& bar);

    // 분석 없이 버퍼만 채움. 받아들인 봉 개수 반환
    std::size_t seed(const std::vector<Bar>& bars);

    void updateTradePrice(double price, long long timestamp_ms);

    // 마지막 봉 이후 체결가가 있으면 체결가, 아니면 마지막 종가 (없으면 0)
    double currentPrice() const;
    std::vector<Bar> recentBars(std::size_t count) const;
    std::size_t barCount() const;

    std::optional<TradingSignal> lastSignal() const;
    std::optional<analytics::PriceActionContext> lastContext() const;
    std::optional<MarketContext> lastMarketContext() const;

    execution::OrderPlan planOrder(const TradingSignal& signal, double equity, double held_quantity) const;

    const std::string& symbol() const { return symbol_; }
    const PipelineConfig& config() const { return config_; }

private:
    void validateBar(const Bar& bar) const;
    std::optional<TradingSignal> processLocked(const Bar& bar, std::vector<core::PipelineEvent>& events);
    std::optional<TradingSignal> analyzeWindow(const std::vector<Bar>& window,
                                               std::vector<core::PipelineEvent>& events);
    core::PipelineEvent makeEvent(core::PipelineEventType type, long long ts_ms, nlohmann::json payload) const;
    void publish(std::vector<core::PipelineEvent>& events);

    const std::string symbol_;
    const PipelineConfig config_;
    std::shared_ptr<core::IEventSink> sink_;

    analytics::PatternDetector detector_;
    analytics::MarketContextAnalyzer market_analyzer_;
    strategy::SignalGenerator signal_generator_;
    risk::RiskFilter risk_filter_;
    execution::OrderPlanner order_planner_;

    mutable std::mutex process_mutex_;
    std::optional<TradingSignal> last_signal_;
    std::optional<analytics::PriceActionContext> last_context_;
    std::optional<MarketContext> last_market_;

    mutable std::shared_mutex buffer_mutex_;
    analytics::RollingWindow window_;
    double trade_price_ = 0.0;
    long long trade_ts_ms_ = 0;
};

} // namespace engine
} // namespace pricelens
