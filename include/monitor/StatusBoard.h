#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IEventSink.h"
#include "core/events/EventChannel.h"

namespace pricelens {
namespace monitor {

struct SymbolStatus {
    std::string symbol;
    double price = 0.0;
    std::string trend = "UNKNOWN";
    std::string structure;
    double volatility = 0.0;
    std::string volume_profile = "UNKNOWN";

    std::string last_signal_type;
    double last_signal_confidence = 0.0;
    std::string last_signal_reason;
    long long last_signal_ts = 0;

    std::string last_error;
    long long last_update_ms = 0;

    std::uint64_t signal_count = 0;
    std::uint64_t rejected_count = 0;
    std::uint64_t error_count = 0;
};

// 심볼별 상태 집계. 파이프라인에 직접 주입하거나 채널에서 pump 로 소비
class StatusBoard : public core::IEventSink {
public:
    StatusBoard() = default;

    void publish(core::PipelineEvent event) override;

    // 채널에 쌓인 이벤트를 모두 반영하고 처리 개수 반환
    std::size_t pump(core::EventChannel& channel);

    std::optional<SymbolStatus> status(const std::string& symbol) const;
    std::vector<SymbolStatus> snapshot() const;
    nlohmann::json toJson() const;

private:
    void apply(const core::PipelineEvent& event);

    mutable std::shared_mutex mutex_;
    std::map<std::string, SymbolStatus> statuses_;
};

} // namespace monitor
} // namespace pricelens
