#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/DataHistory.h"
#include "core/events/EventChannel.h"
#include "engine/PipelineRegistry.h"
#include "monitor/StatusBoard.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace pricelens;

namespace {

struct ReplayOptions {
    std::string config_path = "config/config.json";
    std::string data_path;
    std::string symbol;
    double equity = -1.0;
    std::size_t warmup = 0;
    bool json_mode = false;
    std::string log_level;
};

// 시뮬레이션 계좌 (신호가 체결, 수수료 없음)
struct PaperAccount {
    double cash = 0.0;
    double quantity = 0.0;

    double equity(double price) const { return cash + quantity * price; }
};

void printUsage() {
    std::cout << "Usage: pricelens_replay --data <bars.csv|bars.json> --symbol <SYMBOL>\n"
              << "                        [--config <config.json>] [--equity <amount>]\n"
              << "                        [--warmup <bars>] [--log-level <level>] [--json]\n";
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parseArgs(int argc, char* argv[], ReplayOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--json") {
            options.json_mode = true;
        } else if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--data" && has_value) {
            options.data_path = argv[++i];
        } else if (arg == "--symbol" && has_value) {
            options.symbol = toUpperCopy(argv[++i]);
        } else if (arg == "--equity" && has_value) {
            options.equity = std::stod(argv[++i]);
        } else if (arg == "--warmup" && has_value) {
            options.warmup = static_cast<std::size_t>(std::stoul(argv[++i]));
        } else if (arg == "--log-level" && has_value) {
            options.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }
    return !options.data_path.empty() && !options.symbol.empty();
}

nlohmann::json signalToJson(const TradingSignal& signal, const execution::OrderPlan& plan) {
    return {
        {"timestamp", signal.timestamp},
        {"signal_type", toString(signal.signal_type)},
        {"confidence", signal.confidence},
        {"price", signal.price},
        {"stop_loss", signal.stop_loss},
        {"pattern", toString(signal.pattern)},
        {"reason", signal.reason},
        {"order", {
            {"side", execution::toString(plan.side)},
            {"quantity", plan.quantity},
            {"target_fraction", plan.target_fraction},
            {"reason", plan.reason}
        }}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    ReplayOptions options;
    try {
        if (!parseArgs(argc, argv, options)) {
            printUsage();
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        printUsage();
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(options.config_path);

        const std::string log_level = options.log_level.empty() ? config.getLogLevel() : options.log_level;
        Logger::getInstance().initialize(config.getLogDir(), log_level);

        if (!std::filesystem::exists(options.data_path)) {
            std::cerr << "Data file not found: " << options.data_path << "\n";
            return 1;
        }

        const auto bars = backtest::DataHistory::load(options.data_path, options.symbol);
        if (bars.empty()) {
            std::cerr << "No bars loaded from " << options.data_path << "\n";
            return 1;
        }

        const std::size_t warmup = std::min(options.warmup, bars.size());
        const std::vector<Bar> warmup_bars(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(warmup));

        auto channel = std::make_shared<core::EventChannel>();
        monitor::StatusBoard board;
        engine::PipelineRegistry registry(config.getPipelineConfig(), channel);
        auto pipeline = registry.create(options.symbol, warmup_bars);

        PaperAccount account;
        account.cash = options.equity > 0.0 ? options.equity : config.getInitialEquity();
        const double starting_equity = account.cash;

        LOG_INFO("Replay start: {} bars={} warmup={} equity={:.2f}",
                 options.symbol, bars.size(), warmup, starting_equity);

        nlohmann::json signals_json = nlohmann::json::array();
        std::size_t signal_count = 0;

        for (std::size_t i = warmup; i < bars.size(); ++i) {
            const auto signal = registry.onBar(bars[i]);
            board.pump(*channel);
            if (!signal) {
                continue;
            }

            ++signal_count;
            const auto plan = pipeline->planOrder(*signal, account.equity(signal->price), account.quantity);
            if (plan.actionable()) {
                if (plan.side == execution::OrderSide::BUY) {
                    account.cash -= plan.quantity * signal->price;
                    account.quantity += plan.quantity;
                } else {
                    account.cash += plan.quantity * signal->price;
                    account.quantity -= plan.quantity;
                }
            }

            if (options.json_mode) {
                signals_json.push_back(signalToJson(*signal, plan));
                continue;
            }

            std::cout << std::fixed << std::setprecision(2)
                      << "[" << signal->timestamp << "] "
                      << toString(signal->signal_type) << " @" << signal->price
                      << " conf=" << signal->confidence
                      << " stop=" << signal->stop_loss
                      << " | " << signal->reason << "\n"
                      << "    order: " << execution::toString(plan.side)
                      << std::setprecision(6) << " qty=" << plan.quantity
                      << std::setprecision(3) << " target=" << plan.target_fraction
                      << " (" << plan.reason << ")\n";
        }

        const double last_price = pipeline->currentPrice();
        const double final_equity = account.equity(last_price);
        const auto status = board.status(options.symbol);

        if (options.json_mode) {
            nlohmann::json out;
            out["symbol"] = options.symbol;
            out["bars"] = bars.size();
            out["warmup"] = warmup;
            out["signals"] = signals_json;
            out["starting_equity"] = starting_equity;
            out["final_equity"] = final_equity;
            out["position_quantity"] = account.quantity;
            out["status"] = board.toJson();
            out["dropped_events"] = channel->droppedCount();
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        std::cout << "\nReplay summary\n";
        std::cout << "---------------------------------------------\n";
        std::cout << "Symbol:          " << options.symbol << "\n";
        std::cout << "Bars replayed:   " << (bars.size() - warmup) << " (warm-up " << warmup << ")\n";
        std::cout << "Signals:         " << signal_count << "\n";
        if (status) {
            std::cout << "Rejected:        " << status->rejected_count << "\n";
            std::cout << "Errors:          " << status->error_count << "\n";
            std::cout << "Last trend:      " << status->trend << " (" << status->structure << ")\n";
        }
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "Starting equity: " << starting_equity << "\n";
        std::cout << "Final equity:    " << final_equity << "\n";
        std::cout << "---------------------------------------------\n";
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Replay failed: {}", e.what());
        std::cerr << "Replay failed: " << e.what() << "\n";
        return 1;
    }
}
