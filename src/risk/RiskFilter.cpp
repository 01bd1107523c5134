#include "risk/RiskFilter.h"
#include "common/Logger.h"

namespace pricelens {
namespace risk {

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

RiskFilter::RiskFilter(const engine::RiskFilterConfig& config)
    : config_(config) {
}

RiskDecision RiskFilter::evaluate(
    const std::optional<TradingSignal>& candidate,
    const MarketContext& market,
    const std::optional<TradingSignal>& last_signal
) const {
    RiskDecision decision;
    if (!candidate) {
        return decision;
    }

    // 1. 변동성 과다
    if (market.volatility > config_.max_volatility_pct) {
        LOG_INFO("[RiskFilter] {} volatility too high ({:.2f}%), signal dropped",
                 candidate->symbol, market.volatility);
        decision.reason = kRejectVolatilityHigh;
        return decision;
    }

    TradingSignal signal = *candidate;

    // 2. 저거래량: 신뢰도 할인
    if (market.volume_profile == VolumeProfile::LOW) {
        signal.confidence *= config_.low_volume_confidence_factor;
        if (!endsWith(signal.reason, config_.low_volume_marker)) {
            signal.reason += config_.low_volume_marker;
        }
        decision.adjusted = true;
        LOG_INFO("[RiskFilter] {} low volume, confidence reduced to {:.2f}",
                 signal.symbol, signal.confidence);
    }

    // 3. 같은 방향 신호가 쿨다운 안에 있으면 제외
    if (last_signal && last_signal->signal_type == signal.signal_type) {
        const long long elapsed_ms = signal.timestamp - last_signal->timestamp;
        const long long cooldown_ms = static_cast<long long>(config_.duplicate_cooldown_sec) * 1000LL;
        if (elapsed_ms < cooldown_ms) {
            LOG_INFO("[RiskFilter] {} duplicate {} signal within {}s, dropped",
                     signal.symbol, toString(signal.signal_type), config_.duplicate_cooldown_sec);
            decision.reason = kRejectDuplicateSignal;
            decision.adjusted = false;
            return decision;
        }
    }

    decision.signal = signal;
    return decision;
}

} // namespace risk
} // namespace pricelens
