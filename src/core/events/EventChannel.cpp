#include "core/events/EventChannel.h"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace pricelens {
namespace core {

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventChannel capacity must be positive");
    }
}

void EventChannel::publish(PipelineEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.seq = ++last_seq_;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<PipelineEvent> EventChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    PipelineEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<PipelineEvent> EventChannel::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    PipelineEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<PipelineEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PipelineEvent> out(
        std::make_move_iterator(queue_.begin()),
        std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t EventChannel::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::uint64_t EventChannel::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace pricelens
