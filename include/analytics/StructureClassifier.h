#pragma once

#include "analytics/PriceActionTypes.h"
#include "engine/PipelineConfig.h"
#include <vector>

namespace pricelens {
namespace analytics {

// 추세/횡보 구조 분류
//  - 5봉 미만: TRADING_RANGE
//  - 5~9봉: 평균 대비 이탈 (약추세만)
//  - 10~19봉: EMA 방식
//  - 20봉 이상: 고점/저점 비교, 판단 불가 시 EMA 방식
class StructureClassifier {
public:
    explicit StructureClassifier(const engine::StructureConfig& config = engine::StructureConfig());

    StructureAnalysis analyze(const std::vector<Bar>& window) const;

    MarketStructure classify(const std::vector<Bar>& window) const {
        return analyze(window).structure;
    }

private:
    StructureAnalysis analyzeSimplified(const std::vector<double>& closes) const;
    StructureAnalysis analyzeSwings(const std::vector<Bar>& window) const;
    StructureAnalysis analyzeEma(const std::vector<double>& closes) const;
    bool isBreakoutAttempt(const std::vector<Bar>& window) const;

    engine::StructureConfig config_;
};

} // namespace analytics
} // namespace pricelens
