#include "engine/PipelineRegistry.h"
#include "common/Logger.h"

#include <utility>

namespace pricelens {
namespace engine {

PipelineRegistry::PipelineRegistry(
    const PipelineConfig& config,
    std::shared_ptr<core::IEventSink> sink
)
    : config_(config)
    , sink_(std::move(sink))
{
    config_.validate();
}

std::shared_ptr<PriceActionPipeline> PipelineRegistry::create(
    const std::string& symbol,
    const std::vector<Bar>& warmup_bars
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(symbol);
    if (it != pipelines_.end()) {
        if (!warmup_bars.empty()) {
            LOG_WARN("[Registry] {} already registered, warm-up ignored", symbol);
        }
        return it->second;
    }

    auto pipeline = std::make_shared<PriceActionPipeline>(symbol, config_, sink_, warmup_bars);
    pipelines_.emplace(symbol, pipeline);
    LOG_INFO("[Registry] pipeline created: {} (buffer={})", symbol, config_.buffer_size);
    return pipeline;
}

std::optional<TradingSignal> PipelineRegistry::onBar(const Bar& bar) {
    if (bar.symbol.empty()) {
        LOG_WARN("[Registry] bar without symbol ignored (ts={})", bar.timestamp);
        return std::nullopt;
    }

    // 맵 락은 조회/생성에만 사용
    auto pipeline = create(bar.symbol);
    return pipeline->processNewBar(bar);
}

bool PipelineRegistry::onTrade(const std::string& symbol, double price, long long timestamp_ms) {
    auto pipeline = get(symbol);
    if (!pipeline) {
        return false;
    }
    pipeline->updateTradePrice(price, timestamp_ms);
    return true;
}

std::shared_ptr<PriceActionPipeline> PipelineRegistry::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(symbol);
    if (it == pipelines_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> PipelineRegistry::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(pipelines_.size());
    for (const auto& entry : pipelines_) {
        out.push_back(entry.first);
    }
    return out;
}

std::size_t PipelineRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pipelines_.size();
}

} // namespace engine
} // namespace pricelens
