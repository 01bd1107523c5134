#pragma once

#include "analytics/PriceActionTypes.h"
#include "engine/PipelineConfig.h"
#include <vector>

namespace pricelens {
namespace analytics {

// 가격 행동 컨텍스트 -> 추세 / 변동성(%) / 거래량 프로파일
class MarketContextAnalyzer {
public:
    explicit MarketContextAnalyzer(const engine::PipelineConfig& config = engine::PipelineConfig());

    MarketContext analyze(const PriceActionContext& context, const std::vector<Bar>& window) const;

    static MarketTrend mapTrend(MarketStructure structure);
    double estimateVolatility(const PriceActionContext& context) const;
    VolumeProfile classifyVolume(const std::vector<Bar>& window) const;

private:
    int volume_average_period_;
    double high_volume_ratio_;
    double low_volume_ratio_;
};

} // namespace analytics
} // namespace pricelens
