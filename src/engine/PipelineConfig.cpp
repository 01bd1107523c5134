#include "engine/PipelineConfig.h"

#include <stdexcept>

namespace pricelens {
namespace engine {

void PipelineConfig::validate() const {
    if (buffer_size == 0) {
        throw std::invalid_argument("buffer_size must be positive");
    }
    if (analysis_bars == 0) {
        throw std::invalid_argument("analysis_bars must be positive");
    }
    if (min_bars_for_signal > buffer_size) {
        throw std::invalid_argument("min_bars_for_signal exceeds buffer_size");
    }
    if (min_bars_for_signal > analysis_bars) {
        throw std::invalid_argument("min_bars_for_signal exceeds analysis_bars");
    }
    if (volume_average_period <= 0) {
        throw std::invalid_argument("volume_average_period must be positive");
    }
    if (!(sizing.risk_per_trade > 0.0 && sizing.risk_per_trade <= 1.0)) {
        throw std::invalid_argument("risk_per_trade must be in (0, 1]");
    }
    if (structure.peak_window <= 0 || patterns.swing_distance <= 0 ||
        patterns.wedge_swing_distance <= 0) {
        throw std::invalid_argument("swing windows must be positive");
    }
    if (structure.ema_period <= 0 || structure.lookback <= 0) {
        throw std::invalid_argument("structure periods must be positive");
    }
    if (patterns.failed_breakout_min_penetration > patterns.failed_breakout_max_penetration) {
        throw std::invalid_argument("failed breakout penetration bounds are inverted");
    }
    if (risk.duplicate_cooldown_sec < 0) {
        throw std::invalid_argument("duplicate_cooldown_sec must not be negative");
    }
    if (!(risk.low_volume_confidence_factor > 0.0 && risk.low_volume_confidence_factor <= 1.0)) {
        throw std::invalid_argument("low_volume_confidence_factor must be in (0, 1]");
    }
}

} // namespace engine
} // namespace pricelens
