#pragma once

#include "engine/PriceActionPipeline.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pricelens {
namespace engine {

// symbol -> pipeline. 심볼끼리는 상태를 공유하지 않음
class PipelineRegistry {
public:
    explicit PipelineRegistry(
        const PipelineConfig& config = PipelineConfig(),
        std::shared_ptr<core::IEventSink> sink = nullptr
    );

    // 이미 있으면 기존 파이프라인 반환 (warm-up 은 무시)
    std::shared_ptr<PriceActionPipeline> create(
        const std::string& symbol,
        const std::vector<Bar>& warmup_bars = {}
    );

    // 처음 보는 심볼이면 파이프라인 생성 후 처리
    std::optional<TradingSignal> onBar(const Bar& bar);

    // 등록된 심볼이 없으면 false
    bool onTrade(const std::string& symbol, double price, long long timestamp_ms);

    std::shared_ptr<PriceActionPipeline> get(const std::string& symbol) const;
    std::vector<std::string> symbols() const;
    std::size_t size() const;

private:
    const PipelineConfig config_;
    std::shared_ptr<core::IEventSink> sink_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PriceActionPipeline>> pipelines_;
};

} // namespace engine
} // namespace pricelens
