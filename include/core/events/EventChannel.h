#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "core/contracts/IEventSink.h"

namespace pricelens {
namespace core {

// 용량 제한 FIFO. 가득 차면 가장 오래된 이벤트를 버림
class EventChannel : public IEventSink {
public:
    explicit EventChannel(std::size_t capacity = 4096);

    void publish(PipelineEvent event) override;

    std::optional<PipelineEvent> tryPop();
    std::optional<PipelineEvent> waitPop(std::chrono::milliseconds timeout);
    std::vector<PipelineEvent> drain();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::uint64_t droppedCount() const;
    std::uint64_t lastSeq() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PipelineEvent> queue_;
    std::uint64_t last_seq_ = 0;
    std::uint64_t dropped_ = 0;
};

} // namespace core
} // namespace pricelens
