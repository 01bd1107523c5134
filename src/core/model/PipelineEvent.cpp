#include "core/model/PipelineEvent.h"

#include <stdexcept>

namespace pricelens {
namespace core {

const char* toString(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::MARKET_ANALYSIS_UPDATED: return "MARKET_ANALYSIS_UPDATED";
        case PipelineEventType::SIGNAL_GENERATED: return "SIGNAL_GENERATED";
        case PipelineEventType::SIGNAL_REJECTED: return "SIGNAL_REJECTED";
        case PipelineEventType::ERROR_OCCURRED: return "ERROR_OCCURRED";
    }
    return "ERROR_OCCURRED";
}

PipelineEventType eventTypeFromString(const std::string& value) {
    if (value == "MARKET_ANALYSIS_UPDATED") return PipelineEventType::MARKET_ANALYSIS_UPDATED;
    if (value == "SIGNAL_GENERATED") return PipelineEventType::SIGNAL_GENERATED;
    if (value == "SIGNAL_REJECTED") return PipelineEventType::SIGNAL_REJECTED;
    if (value == "ERROR_OCCURRED") return PipelineEventType::ERROR_OCCURRED;
    throw std::invalid_argument("unknown pipeline event type: " + value);
}

nlohmann::json toJson(const PipelineEvent& event) {
    nlohmann::json line;
    line["seq"] = event.seq;
    line["ts_ms"] = event.ts_ms;
    line["type"] = toString(event.type);
    line["symbol"] = event.symbol;
    line["payload"] = event.payload;
    return line;
}

} // namespace core
} // namespace pricelens
