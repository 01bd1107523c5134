#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace pricelens {
namespace core {

enum class PipelineEventType {
    MARKET_ANALYSIS_UPDATED,
    SIGNAL_GENERATED,
    SIGNAL_REJECTED,
    ERROR_OCCURRED
};

struct PipelineEvent {
    std::uint64_t seq = 0;          // 채널이 발행 시 부여
    long long ts_ms = 0;
    PipelineEventType type = PipelineEventType::MARKET_ANALYSIS_UPDATED;
    std::string symbol;
    nlohmann::json payload = nlohmann::json::object();
};

const char* toString(PipelineEventType type);
PipelineEventType eventTypeFromString(const std::string& value);

nlohmann::json toJson(const PipelineEvent& event);

} // namespace core
} // namespace pricelens
