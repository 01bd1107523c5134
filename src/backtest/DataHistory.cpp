#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include "common/Logger.h"

namespace pricelens {
namespace backtest {

namespace {

// 10^11 미만이면 초 단위로 간주
constexpr long long kSecondsThreshold = 100000000000LL;

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

template <typename T>
bool readField(const nlohmann::json& item, const char* key, const char* short_key, T& out) {
    if (item.contains(key) && !item[key].is_null()) {
        out = item[key].get<T>();
        return true;
    }
    if (item.contains(short_key) && !item[short_key].is_null()) {
        out = item[short_key].get<T>();
        return true;
    }
    return false;
}

std::string lowerExtension(const std::string& path) {
    const auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path, const std::string& symbol) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;
        if (!row[0].empty() && !std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // 헤더
            if (line_no == 1) continue;
        }
        if (row.size() < 6) {
            LOG_WARN("Skipping malformed row {} in {}: {}", line_no, file_path, line);
            continue;
        }

        try {
            Bar bar;
            bar.symbol = symbol;
            bar.timestamp = normalizeTimestamp(std::stoll(row[0]));
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = std::stod(row[5]);
            if (row.size() > 6 && !row[6].empty()) bar.vwap = std::stod(row[6]);
            if (row.size() > 7 && !row[7].empty()) bar.trade_count = std::stoll(row[7]);
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row {} in {}: {} - {}", line_no, file_path, line, e.what());
        }
    }

    sortAndDeduplicate(bars, file_path);
    LOG_INFO("Loaded {} bars for {} from {}", bars.size(), symbol, file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path, const std::string& symbol) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        return bars;
    }

    // {"bars": [...]} 형태도 허용
    const nlohmann::json& items = (j.is_object() && j.contains("bars")) ? j["bars"] : j;
    if (!items.is_array()) {
        LOG_ERROR("JSON bar file must contain an array: {}", file_path);
        return bars;
    }

    for (const auto& item : items) {
        try {
            Bar bar;
            bar.symbol = symbol;
            long long ts = 0;
            if (!readField(item, "timestamp", "t", ts) ||
                !readField(item, "open", "o", bar.open) ||
                !readField(item, "high", "h", bar.high) ||
                !readField(item, "low", "l", bar.low) ||
                !readField(item, "close", "c", bar.close)) {
                LOG_WARN("Skipping incomplete JSON bar in {}: {}", file_path, item.dump());
                continue;
            }
            bar.timestamp = normalizeTimestamp(ts);
            readField(item, "volume", "v", bar.volume);

            double vwap = 0.0;
            if (readField(item, "vwap", "vw", vwap)) bar.vwap = vwap;
            long long trade_count = 0;
            if (readField(item, "trade_count", "n", trade_count)) bar.trade_count = trade_count;

            bars.push_back(bar);
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed JSON bar in {}: {}", file_path, e.what());
        }
    }

    sortAndDeduplicate(bars, file_path);
    LOG_INFO("Loaded {} bars for {} from {}", bars.size(), symbol, file_path);
    return bars;
}

std::vector<Bar> DataHistory::load(const std::string& file_path, const std::string& symbol) {
    if (lowerExtension(file_path) == "json") {
        return loadJSON(file_path, symbol);
    }
    return loadCSV(file_path, symbol);
}

std::vector<Bar> DataHistory::filterByTime(const std::vector<Bar>& bars, long long start_ms, long long end_ms) {
    std::vector<Bar> out;
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(out), [&](const Bar& bar) {
        return bar.timestamp >= start_ms && bar.timestamp <= end_ms;
    });
    return out;
}

long long DataHistory::normalizeTimestamp(long long raw) {
    if (raw > 0 && raw < kSecondsThreshold) {
        return raw * 1000LL;
    }
    return raw;
}

void DataHistory::sortAndDeduplicate(std::vector<Bar>& bars, const std::string& source) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    const auto before = bars.size();
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp == b.timestamp;
    }), bars.end());

    if (bars.size() != before) {
        LOG_WARN("Dropped {} duplicate timestamps from {}", before - bars.size(), source);
    }
}

} // namespace backtest
} // namespace pricelens
