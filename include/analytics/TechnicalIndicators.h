#pragma once

#include <cstddef>
#include <vector>
#include "common/Types.h"

namespace pricelens {
namespace analytics {

// 가격 계열 보조 계산
class TechnicalIndicators {
public:
    // EMA 계열 (첫 값으로 시드, 재귀 평활). 입력과 길이가 같음
    static std::vector<double> calculateEMASeries(const std::vector<double>& prices, int period);

    // 최근 period 개 단순 평균. 데이터 부족 시 0
    static double calculateSMA(const std::vector<double>& prices, int period);

    static double calculateMean(const std::vector<double>& values);

    // 좌우 window 개 모두보다 크거나 같은 점 (양 끝 window 개는 제외)
    static std::vector<std::size_t> findLocalPeaks(const std::vector<double>& values, int window);
    static std::vector<std::size_t> findLocalValleys(const std::vector<double>& values, int window);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
    static std::vector<double> extractHighs(const std::vector<Bar>& bars);
    static std::vector<double> extractLows(const std::vector<Bar>& bars);
    static std::vector<double> extractVolumes(const std::vector<Bar>& bars);

    // 최근 count 개 (부족하면 전체)
    static std::vector<double> tail(const std::vector<double>& values, std::size_t count);

private:
    static bool isLocalMaximum(const std::vector<double>& values, std::size_t index, int window);
    static bool isLocalMinimum(const std::vector<double>& values, std::size_t index, int window);
};

} // namespace analytics
} // namespace pricelens
