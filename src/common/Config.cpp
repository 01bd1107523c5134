#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace pricelens {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    pipeline_config_ = engine::PipelineConfig();
    log_dir_ = "logs";
    log_level_ = "info";
    initial_equity_ = 100000.0;
    symbols_.clear();
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else if (std::filesystem::exists(path)) {
        config_path = std::filesystem::absolute(path);
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {}", config_path.string());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        applyJson(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Config load error: {}", e.what());
        return false;
    }

    LOG_INFO("Config loaded: buffer_size={}, risk_per_trade={}",
             pipeline_config_.buffer_size, pipeline_config_.sizing.risk_per_trade);
    return true;
}

void Config::applyJson(const nlohmann::json& j) {
    // 부분 적용을 막기 위해 사본에 먼저 반영
    engine::PipelineConfig cfg = pipeline_config_;
    std::vector<std::string> symbols = symbols_;
    double initial_equity = initial_equity_;
    std::string log_dir = log_dir_;
    std::string log_level = log_level_;

    if (j.contains("pipeline")) {
        const auto& p = j["pipeline"];
        cfg.buffer_size = p.value("buffer_size", cfg.buffer_size);
        cfg.analysis_bars = p.value("analysis_bars", cfg.analysis_bars);
        cfg.min_bars_for_signal = p.value("min_bars_for_signal", cfg.min_bars_for_signal);
        cfg.volume_average_period = p.value("volume_average_period", cfg.volume_average_period);
        cfg.high_volume_ratio = p.value("high_volume_ratio", cfg.high_volume_ratio);
        cfg.low_volume_ratio = p.value("low_volume_ratio", cfg.low_volume_ratio);

        if (p.contains("symbols")) {
            symbols.clear();
            for (const auto& s : p["symbols"].get<std::vector<std::string>>()) {
                const auto normalized = normalizeSymbol(s);
                if (!normalized.empty()) {
                    symbols.push_back(normalized);
                }
            }
        }
        initial_equity = p.value("initial_equity", initial_equity);
    }

    if (j.contains("structure")) {
        const auto& s = j["structure"];
        cfg.structure.peak_window = s.value("peak_window", cfg.structure.peak_window);
        cfg.structure.lookback = s.value("lookback", cfg.structure.lookback);
        cfg.structure.ema_period = s.value("ema_period", cfg.structure.ema_period);
        cfg.structure.crossing_lookback = s.value("crossing_lookback", cfg.structure.crossing_lookback);
        cfg.structure.range_crossings = s.value("range_crossings", cfg.structure.range_crossings);
        cfg.structure.strong_threshold = s.value("strong_threshold", cfg.structure.strong_threshold);
        cfg.structure.ema_strong_threshold = s.value("ema_strong_threshold", cfg.structure.ema_strong_threshold);
        cfg.structure.ema_deviation_threshold =
            s.value("ema_deviation_threshold", cfg.structure.ema_deviation_threshold);
        cfg.structure.simplified_deviation_threshold =
            s.value("simplified_deviation_threshold", cfg.structure.simplified_deviation_threshold);
    }

    if (j.contains("patterns")) {
        const auto& p = j["patterns"];
        auto& pc = cfg.patterns;
        pc.swing_distance = p.value("swing_distance", pc.swing_distance);
        pc.breakout_lookback = p.value("breakout_lookback", pc.breakout_lookback);
        pc.wedge_lookback = p.value("wedge_lookback", pc.wedge_lookback);
        pc.wedge_swing_distance = p.value("wedge_swing_distance", pc.wedge_swing_distance);
        pc.wedge_converging_min_ratio = p.value("wedge_converging_min_ratio", pc.wedge_converging_min_ratio);
        pc.wedge_diverging_min_ratio = p.value("wedge_diverging_min_ratio", pc.wedge_diverging_min_ratio);
        pc.pullback_min_rebound = p.value("pullback_min_rebound", pc.pullback_min_rebound);
        pc.key_level_lookback = p.value("key_level_lookback", pc.key_level_lookback);
        pc.key_level_tolerance = p.value("key_level_tolerance", pc.key_level_tolerance);
        pc.key_level_min_hits = p.value("key_level_min_hits", pc.key_level_min_hits);
        pc.key_level_strong_hits = p.value("key_level_strong_hits", pc.key_level_strong_hits);
        pc.trendline_break_threshold = p.value("trendline_break_threshold", pc.trendline_break_threshold);
        pc.failed_breakout_lookback = p.value("failed_breakout_lookback", pc.failed_breakout_lookback);
        pc.failed_breakout_reversal_bars =
            p.value("failed_breakout_reversal_bars", pc.failed_breakout_reversal_bars);
        pc.failed_breakout_min_penetration =
            p.value("failed_breakout_min_penetration", pc.failed_breakout_min_penetration);
        pc.failed_breakout_max_penetration =
            p.value("failed_breakout_max_penetration", pc.failed_breakout_max_penetration);
        pc.failed_breakout_min_reversal =
            p.value("failed_breakout_min_reversal", pc.failed_breakout_min_reversal);
    }

    if (j.contains("signals")) {
        const auto& s = j["signals"];
        auto& sc = cfg.signals;
        sc.breakout_min_volatility = s.value("breakout_min_volatility", sc.breakout_min_volatility);
        sc.breakout_aligned_confidence = s.value("breakout_aligned_confidence", sc.breakout_aligned_confidence);
        sc.breakout_range_confidence = s.value("breakout_range_confidence", sc.breakout_range_confidence);
        sc.pullback_confidence = s.value("pullback_confidence", sc.pullback_confidence);
        sc.wedge_confidence = s.value("wedge_confidence", sc.wedge_confidence);
        sc.trendline_confidence = s.value("trendline_confidence", sc.trendline_confidence);
        sc.failed_breakout_confidence = s.value("failed_breakout_confidence", sc.failed_breakout_confidence);
        sc.key_level_confidence = s.value("key_level_confidence", sc.key_level_confidence);
        sc.key_level_strong_confidence = s.value("key_level_strong_confidence", sc.key_level_strong_confidence);
        sc.reversal_confidence = s.value("reversal_confidence", sc.reversal_confidence);
        sc.stop_lookback = s.value("stop_lookback", sc.stop_lookback);
    }

    if (j.contains("risk")) {
        const auto& r = j["risk"];
        cfg.risk.max_volatility_pct = r.value("max_volatility_pct", cfg.risk.max_volatility_pct);
        cfg.risk.low_volume_confidence_factor =
            r.value("low_volume_confidence_factor", cfg.risk.low_volume_confidence_factor);
        cfg.risk.duplicate_cooldown_sec = r.value("duplicate_cooldown_sec", cfg.risk.duplicate_cooldown_sec);
        cfg.risk.low_volume_marker = r.value("low_volume_marker", cfg.risk.low_volume_marker);
    }

    if (j.contains("sizing")) {
        const auto& s = j["sizing"];
        cfg.sizing.risk_per_trade = s.value("risk_per_trade", cfg.sizing.risk_per_trade);
        cfg.sizing.min_execution_confidence =
            s.value("min_execution_confidence", cfg.sizing.min_execution_confidence);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_dir = trimCopy(l.value("dir", log_dir));
        log_level = trimCopy(l.value("level", log_level));
    }

    cfg.validate();
    pipeline_config_ = cfg;
    symbols_ = symbols;
    initial_equity_ = initial_equity;
    log_dir_ = log_dir;
    log_level_ = log_level;
}

} // namespace pricelens
