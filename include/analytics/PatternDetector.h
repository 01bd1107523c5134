#pragma once

#include "analytics/BarQualityClassifier.h"
#include "analytics/PriceActionTypes.h"
#include "analytics/StructureClassifier.h"
#include "engine/PipelineConfig.h"
#include <optional>
#include <string>
#include <vector>

namespace pricelens {
namespace analytics {

// 가격 행동 패턴 탐지
// 모든 탐지 함수는 window 에만 의존 (window.back() = 현재 봉)
class PatternDetector {
public:
    explicit PatternDetector(
        const engine::PatternConfig& config = engine::PatternConfig(),
        const engine::StructureConfig& structure_config = engine::StructureConfig()
    );

    // 좌측 distance 봉보다 크고 우측 distance 봉 이상인 고점 (저점은 반대)
    std::vector<SwingPoint> findSwingHighs(const std::vector<Bar>& window, int distance) const;
    std::vector<SwingPoint> findSwingLows(const std::vector<Bar>& window, int distance) const;

    std::optional<RangeBreakout> detectRangeBreakout(const std::vector<Bar>& window) const;
    std::optional<TwoLegPullback> detectTwoLegPullback(const std::vector<Bar>& window) const;
    std::optional<WedgePattern> detectWedge(const std::vector<Bar>& window) const;
    std::optional<TestPattern> detectKeyLevelTest(const std::vector<Bar>& window) const;
    std::optional<TrendlineBreak> detectTrendlineBreak(const std::vector<Bar>& window) const;
    std::optional<FailedBreakout> detectFailedBreakout(const std::vector<Bar>& window) const;

    KeyLevelFlag detectKeyLevel(const std::vector<Bar>& window) const;
    std::optional<ConsecutivePattern> detectConsecutive(const std::vector<Bar>& window) const;

    // 봉 품질 + 구조 + 전체 패턴 결과를 하나로 묶음
    PriceActionContext buildContext(const std::string& symbol, const std::vector<Bar>& window) const;

    const engine::PatternConfig& config() const { return config_; }

private:
    std::optional<FailedBreakout> checkFailedBreakout(
        const std::vector<Bar>& window,
        const SwingPoint& swing,
        bool above
    ) const;

    engine::PatternConfig config_;
    engine::StructureConfig structure_config_;
    BarQualityClassifier bar_classifier_;
    StructureClassifier structure_classifier_;
};

} // namespace analytics
} // namespace pricelens
