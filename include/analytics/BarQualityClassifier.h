#pragma once

#include "analytics/PriceActionTypes.h"
#include <vector>

namespace pricelens {
namespace analytics {

// 최신 봉의 캔들 형태 분류
class BarQualityClassifier {
public:
    BarQualityClassifier() = default;

    // window.back() 이 분류 대상. 반전 판정에 직전 종가 흐름을 사용
    BarQualityAnalysis analyze(const std::vector<Bar>& window) const;

    BarQuality classify(const std::vector<Bar>& window) const {
        return analyze(window).quality;
    }

private:
    static bool closesFalling(const std::vector<Bar>& window, std::size_t count);
    static bool closesRising(const std::vector<Bar>& window, std::size_t count);
};

} // namespace analytics
} // namespace pricelens
