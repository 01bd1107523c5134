#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace pricelens {
namespace backtest {

class DataHistory {
public:
    // CSV: timestamp,open,high,low,close,volume[,vwap[,trade_count]]
    // 헤더/형식 오류 행은 건너뜀
    static std::vector<Bar> loadCSV(const std::string& file_path, const std::string& symbol);

    // JSON 배열. 키: timestamp|t, open|o, high|h, low|l, close|c, volume|v, vwap|vw, trade_count|n
    static std::vector<Bar> loadJSON(const std::string& file_path, const std::string& symbol);

    // 확장자로 CSV/JSON 선택
    static std::vector<Bar> load(const std::string& file_path, const std::string& symbol);

    // [start_ms, end_ms] 구간
    static std::vector<Bar> filterByTime(const std::vector<Bar>& bars, long long start_ms, long long end_ms);

    // 초 단위 timestamp 는 ms 로 변환
    static long long normalizeTimestamp(long long raw);

private:
    static void sortAndDeduplicate(std::vector<Bar>& bars, const std::string& source);
};

} // namespace backtest
} // namespace pricelens
