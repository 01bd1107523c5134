#include "monitor/StatusBoard.h"

#include <mutex>

namespace pricelens {
namespace monitor {

void StatusBoard::publish(core::PipelineEvent event) {
    apply(event);
}

std::size_t StatusBoard::pump(core::EventChannel& channel) {
    std::size_t count = 0;
    for (const auto& event : channel.drain()) {
        apply(event);
        ++count;
    }
    return count;
}

void StatusBoard::apply(const core::PipelineEvent& event) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& status = statuses_[event.symbol];
    status.symbol = event.symbol;
    status.last_update_ms = event.ts_ms;
    const auto& payload = event.payload;

    switch (event.type) {
        case core::PipelineEventType::MARKET_ANALYSIS_UPDATED:
            status.price = payload.value("price", status.price);
            status.trend = payload.value("trend", status.trend);
            status.structure = payload.value("structure", status.structure);
            status.volatility = payload.value("volatility", status.volatility);
            status.volume_profile = payload.value("volume_profile", status.volume_profile);
            break;
        case core::PipelineEventType::SIGNAL_GENERATED:
            ++status.signal_count;
            status.last_signal_type = payload.value("signal_type", std::string());
            status.last_signal_confidence = payload.value("confidence", 0.0);
            status.last_signal_reason = payload.value("reason", std::string());
            status.last_signal_ts = event.ts_ms;
            break;
        case core::PipelineEventType::SIGNAL_REJECTED:
            ++status.rejected_count;
            break;
        case core::PipelineEventType::ERROR_OCCURRED:
            ++status.error_count;
            status.last_error = payload.value("message", std::string());
            break;
    }
}

std::optional<SymbolStatus> StatusBoard::status(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = statuses_.find(symbol);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SymbolStatus> StatusBoard::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SymbolStatus> out;
    out.reserve(statuses_.size());
    for (const auto& entry : statuses_) {
        out.push_back(entry.second);
    }
    return out;
}

nlohmann::json StatusBoard::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& status : snapshot()) {
        nlohmann::json row;
        row["price"] = status.price;
        row["trend"] = status.trend;
        row["structure"] = status.structure;
        row["volatility"] = status.volatility;
        row["volume_profile"] = status.volume_profile;
        row["last_signal"] = {
            {"type", status.last_signal_type},
            {"confidence", status.last_signal_confidence},
            {"reason", status.last_signal_reason},
            {"ts", status.last_signal_ts}
        };
        row["signal_count"] = status.signal_count;
        row["rejected_count"] = status.rejected_count;
        row["error_count"] = status.error_count;
        row["last_error"] = status.last_error;
        row["last_update_ms"] = status.last_update_ms;
        out[status.symbol] = row;
    }
    return out;
}

} // namespace monitor
} // namespace pricelens
