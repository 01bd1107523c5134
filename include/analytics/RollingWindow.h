#pragma once

#include "common/Types.h"
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace pricelens {
namespace analytics {

// 심볼별 최근 봉 버퍼 (FIFO, 용량 초과 시 가장 오래된 봉 제거)
// 동기화는 소유자(PriceActionPipeline)가 담당
class RollingWindow {
public:
    explicit RollingWindow(std::size_t capacity);

    void push(const Bar& bar);

    // 최근 count 개 (오래된 순). 데이터가 부족하면 있는 만큼
    std::vector<Bar> snapshot(std::size_t count) const;

    std::optional<Bar> latest() const;

    std::size_t size() const { return bars_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return bars_.empty(); }

private:
    std::size_t capacity_;
    std::deque<Bar> bars_;
};

} // namespace analytics
} // namespace pricelens
