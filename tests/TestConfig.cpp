#include "common/Config.h"
#include "common/Logger.h"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

// Simple manual test runner
int main() {
    using namespace pricelens;

    spdlog::set_level(spdlog::level::debug);
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    Config& config = Config::getInstance();
    config.reset();
    int failures = 0;
    auto expect = [&failures](bool condition, const std::string& message) {
        if (!condition) {
            std::cerr << "[TEST] " << message << std::endl;
            ++failures;
        }
    };

    // 1. Defaults
    {
        const auto cfg = config.getPipelineConfig();
        expect(cfg.buffer_size == 1000, "default buffer_size should be 1000");
        expect(cfg.min_bars_for_signal == 20, "default min_bars_for_signal should be 20");
        expect(std::abs(cfg.sizing.risk_per_trade - 0.02) < 1e-12, "default risk_per_trade should be 0.02");
        expect(cfg.risk.duplicate_cooldown_sec == 300, "default cooldown should be 300s");
        expect(config.getLogLevel() == "info", "default log level should be info");
    }

    // 2. Partial JSON overrides only the named keys
    {
        nlohmann::json j = {
            {"pipeline", {{"buffer_size", 200}, {"symbols", {" aapl ", "msft", ""}}, {"initial_equity", 5000.0}}},
            {"risk", {{"max_volatility_pct", 4.0}}},
            {"sizing", {{"risk_per_trade", 0.01}}},
            {"logging", {{"level", " debug "}}}
        };
        config.applyJson(j);
        const auto cfg = config.getPipelineConfig();
        expect(cfg.buffer_size == 200, "buffer_size override failed");
        expect(cfg.analysis_bars == 50, "analysis_bars should keep its default");
        expect(std::abs(cfg.risk.max_volatility_pct - 4.0) < 1e-12, "max_volatility_pct override failed");
        expect(std::abs(cfg.sizing.risk_per_trade - 0.01) < 1e-12, "risk_per_trade override failed");
        expect(config.getLogLevel() == "debug", "log level should be trimmed");
        const auto symbols = config.getSymbols();
        expect(symbols.size() == 2 && symbols[0] == "AAPL" && symbols[1] == "MSFT",
               "symbols should be normalized and blanks dropped");
        expect(std::abs(config.getInitialEquity() - 5000.0) < 1e-9, "initial_equity override failed");
    }

    // 3. Invalid values throw and keep the previous config
    {
        bool threw = false;
        try {
            config.applyJson({{"pipeline", {{"buffer_size", 0}}}, {"sizing", {{"risk_per_trade", 0.05}}}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "buffer_size 0 should throw");
        expect(config.getPipelineConfig().buffer_size == 200, "failed apply must not change buffer_size");
        expect(std::abs(config.getPipelineConfig().sizing.risk_per_trade - 0.01) < 1e-12,
               "failed apply must not partially change risk_per_trade");

        threw = false;
        try {
            config.applyJson({{"sizing", {{"risk_per_trade", 1.5}}}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "risk_per_trade 1.5 should throw");
    }

    // 4. Missing file keeps defaults
    config.reset();
    expect(!config.load("/nonexistent/pricelens/config.json"), "missing file should return false");
    expect(config.getPipelineConfig().buffer_size == 1000, "missing file should keep defaults");

    // 5. Load from a temp file
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const auto path = std::filesystem::temp_directory_path() /
                          ("pricelens_config_" + std::to_string(stamp) + ".json");
        {
            std::ofstream out(path);
            out << R"({"pipeline": {"buffer_size": 300, "min_bars_for_signal": 25},)"
                << R"( "structure": {"ema_period": 14}, "signals": {"stop_lookback": 4}})";
        }
        expect(config.load(path.string()), "temp config should load");
        const auto cfg = config.getPipelineConfig();
        expect(cfg.buffer_size == 300 && cfg.min_bars_for_signal == 25, "pipeline section not applied");
        expect(cfg.structure.ema_period == 14, "structure section not applied");
        expect(cfg.signals.stop_lookback == 4, "signals section not applied");

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        expect(!config.load(path.string()), "malformed file should return false");
        expect(config.getPipelineConfig().buffer_size == 300, "malformed file should keep the loaded values");

        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    config.reset();

    if (failures > 0) {
        std::cerr << "[TEST] Config Test FAILED (" << failures << ")" << std::endl;
        return 1;
    }
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
