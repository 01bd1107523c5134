#include "engine/PriceActionPipeline.h"
#include "common/Logger.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace pricelens {
namespace engine {

namespace {

PipelineConfig validated(const PipelineConfig& config) {
    config.validate();
    return config;
}

bool positiveFinite(double value) {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

PriceActionPipeline::PriceActionPipeline(
    std::string symbol,
    const PipelineConfig& config,
    std::shared_ptr<core::IEventSink> sink,
    const std::vector<Bar>& warmup_bars
)
    : symbol_(std::move(symbol))
    , config_(validated(config))
    , sink_(std::move(sink))
    , detector_(config_.patterns, config_.structure)
    , market_analyzer_(config_)
    , signal_generator_(config_.signals)
    , risk_filter_(config_.risk)
    , order_planner_(config_.sizing)
    , window_(config_.buffer_size)
{
    if (symbol_.empty()) {
        throw std::invalid_argument("pipeline symbol must not be empty");
    }

    if (!warmup_bars.empty()) {
        const auto accepted = seed(warmup_bars);
        LOG_INFO("[Pipeline] {} warm-up loaded {} / {} bars", symbol_, accepted, warmup_bars.size());
    }
}

std::optional<TradingSignal> PriceActionPipeline::processNewBar(const Bar& bar) {
    std::vector<core::PipelineEvent> events;
    std::optional<TradingSignal> signal;
    {
        std::lock_guard<std::mutex> process_lock(process_mutex_);
        try {
            signal = processLocked(bar, events);
        } catch (const std::exception& e) {
            LOG_ERROR("[Pipeline] {} bar processing failed: {}", symbol_, e.what());
            events.push_back(makeEvent(core::PipelineEventType::ERROR_OCCURRED, bar.timestamp,
                                       {{"message", e.what()}}));
            signal.reset();
        } catch (...) {
            LOG_ERROR("[Pipeline] {} bar processing failed: unknown exception", symbol_);
            events.push_back(makeEvent(core::PipelineEventType::ERROR_OCCURRED, bar.timestamp,
                                       {{"message", "unknown exception"}}));
            signal.reset();
        }
    }

    publish(events);
    return signal;
}

// process_mutex_ 를 잡은 상태에서 호출
std::optional<TradingSignal> PriceActionPipeline::processLocked(
    const Bar& bar,
    std::vector<core::PipelineEvent>& events
) {
    std::vector<Bar> window;
    {
        std::unique_lock<std::shared_mutex> buffer_lock(buffer_mutex_);
        validateBar(bar);
        window_.push(bar);
        if (window_.size() < config_.min_bars_for_signal) {
            return std::nullopt;
        }
        window = window_.snapshot(config_.analysis_bars);
    }

    return analyzeWindow(window, events);
}

std::size_t PriceActionPipeline::seed(const std::vector<Bar>& bars) {
    std::lock_guard<std::mutex> process_lock(process_mutex_);
    std::unique_lock<std::shared_mutex> buffer_lock(buffer_mutex_);

    std::size_t accepted = 0;
    for (const auto& bar : bars) {
        try {
            validateBar(bar);
        } catch (const std::invalid_argument& e) {
            LOG_WARN("[Pipeline] {} warm-up bar skipped: {}", symbol_, e.what());
            continue;
        }
        window_.push(bar);
        ++accepted;
    }
    return accepted;
}

void PriceActionPipeline::updateTradePrice(double price, long long timestamp_ms) {
    if (!positiveFinite(price)) {
        LOG_WARN("[Pipeline] {} invalid trade price ignored: {}", symbol_, price);
        return;
    }

    std::unique_lock<std::shared_mutex> lock(buffer_mutex_);
    if (timestamp_ms < trade_ts_ms_) {
        return;
    }
    trade_price_ = price;
    trade_ts_ms_ = timestamp_ms;
}

double PriceActionPipeline::currentPrice() const {
    std::shared_lock<std::shared_mutex> lock(buffer_mutex_);
    const auto latest = window_.latest();
    if (trade_price_ > 0.0 && (!latest || trade_ts_ms_ >= latest->timestamp)) {
        return trade_price_;
    }
    return latest ? latest->close : 0.0;
}

std::vector<Bar> PriceActionPipeline::recentBars(std::size_t count) const {
    std::shared_lock<std::shared_mutex> lock(buffer_mutex_);
    return window_.snapshot(count);
}

std::size_t PriceActionPipeline::barCount() const {
    std::shared_lock<std::shared_mutex> lock(buffer_mutex_);
    return window_.size();
}

std::optional<TradingSignal> PriceActionPipeline::lastSignal() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return last_signal_;
}

std::optional<analytics::PriceActionContext> PriceActionPipeline::lastContext() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return last_context_;
}

std::optional<MarketContext> PriceActionPipeline::lastMarketContext() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return last_market_;
}

execution::OrderPlan PriceActionPipeline::planOrder(
    const TradingSignal& signal,
    double equity,
    double held_quantity
) const {
    return order_planner_.plan(signal, equity, held_quantity);
}

// buffer_mutex_ 를 잡은 상태에서 호출
void PriceActionPipeline::validateBar(const Bar& bar) const {
    if (bar.symbol != symbol_) {
        throw std::invalid_argument("bar symbol mismatch: " + bar.symbol + " != " + symbol_);
    }
    if (!positiveFinite(bar.open) || !positiveFinite(bar.high) ||
        !positiveFinite(bar.low) || !positiveFinite(bar.close)) {
        throw std::invalid_argument("bar prices must be finite and positive");
    }
    if (bar.low > bar.open || bar.low > bar.close || bar.open > bar.high || bar.close > bar.high) {
        throw std::invalid_argument("bar OHLC out of order");
    }
    if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
        throw std::invalid_argument("bar volume must be non-negative");
    }

    const auto latest = window_.latest();
    if (latest && bar.timestamp <= latest->timestamp) {
        throw std::invalid_argument("bar timestamp not increasing: " + std::to_string(bar.timestamp) +
                                    " <= " + std::to_string(latest->timestamp));
    }
}

std::optional<TradingSignal> PriceActionPipeline::analyzeWindow(
    const std::vector<Bar>& window,
    std::vector<core::PipelineEvent>& events
) {
    const Bar& bar = window.back();

    auto context = detector_.buildContext(symbol_, window);
    auto market = market_analyzer_.analyze(context, window);
    last_context_ = context;
    last_market_ = market;

    LOG_DEBUG("[Pipeline] {} structure={} bar={} strength={:.2f} key_level={}",
              symbol_, analytics::toString(context.market_structure),
              analytics::toString(context.barQuality()), context.trend_strength, context.at_key_level);

    events.push_back(makeEvent(core::PipelineEventType::MARKET_ANALYSIS_UPDATED, bar.timestamp, {
        {"price", market.current_price},
        {"trend", toString(market.trend)},
        {"structure", analytics::toString(context.market_structure)},
        {"bar_quality", analytics::toString(context.barQuality())},
        {"trend_strength", context.trend_strength},
        {"at_key_level", context.at_key_level},
        {"volatility", market.volatility},
        {"volume_profile", toString(market.volume_profile)}
    }));

    const auto candidate = signal_generator_.generate(context, market, window);
    const auto decision = risk_filter_.evaluate(candidate, market, last_signal_);

    if (decision.rejected()) {
        events.push_back(makeEvent(core::PipelineEventType::SIGNAL_REJECTED, bar.timestamp, {
            {"signal_type", toString(candidate->signal_type)},
            {"confidence", candidate->confidence},
            {"pattern", toString(candidate->pattern)},
            {"reason", *decision.reason},
            {"signal_reason", candidate->reason}
        }));
        return std::nullopt;
    }

    if (!decision.signal) {
        return std::nullopt;
    }

    const TradingSignal& signal = *decision.signal;
    last_signal_ = signal;

    LOG_INFO("[SIGNAL] {} {} @{:.2f} conf={:.2f} stop={:.2f} ({})",
             symbol_, toString(signal.signal_type), signal.price, signal.confidence,
             signal.stop_loss, signal.reason);

    events.push_back(makeEvent(core::PipelineEventType::SIGNAL_GENERATED, bar.timestamp, {
        {"signal_type", toString(signal.signal_type)},
        {"confidence", signal.confidence},
        {"price", signal.price},
        {"stop_loss", signal.stop_loss},
        {"pattern", toString(signal.pattern)},
        {"reason", signal.reason},
        {"adjusted", decision.adjusted}
    }));
    return decision.signal;
}

core::PipelineEvent PriceActionPipeline::makeEvent(
    core::PipelineEventType type,
    long long ts_ms,
    nlohmann::json payload
) const {
    core::PipelineEvent event;
    event.ts_ms = ts_ms;
    event.type = type;
    event.symbol = symbol_;
    event.payload = std::move(payload);
    return event;
}

// 락 밖에서 호출. sink 실패는 로그만 남기고 다음 이벤트 계속
void PriceActionPipeline::publish(std::vector<core::PipelineEvent>& events) {
    if (!sink_) {
        return;
    }

    for (auto& event : events) {
        const auto type = event.type;
        try {
            sink_->publish(std::move(event));
        } catch (const std::exception& e) {
            LOG_ERROR("[Pipeline] {} event publish failed ({}): {}", symbol_, core::toString(type), e.what());
        } catch (...) {
            LOG_ERROR("[Pipeline] {} event publish failed ({}): unknown exception", symbol_, core::toString(type));
        }
    }
}

} // namespace engine
} // namespace pricelens
