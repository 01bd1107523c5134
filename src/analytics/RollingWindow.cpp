#include "analytics/RollingWindow.h"
#include <algorithm>
#include <stdexcept>

namespace pricelens {
namespace analytics {

RollingWindow::RollingWindow(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("RollingWindow capacity must be positive");
    }
}

void RollingWindow::push(const Bar& bar) {
    bars_.push_back(bar);
    while (bars_.size() > capacity_) {
        bars_.pop_front();
    }
}

std::vector<Bar> RollingWindow::snapshot(std::size_t count) const {
    const std::size_t n = std::min(count, bars_.size());
    return std::vector<Bar>(bars_.end() - static_cast<std::ptrdiff_t>(n), bars_.end());
}

std::optional<Bar> RollingWindow::latest() const {
    if (bars_.empty()) {
        return std::nullopt;
    }
    return bars_.back();
}

} // namespace analytics
} // namespace pricelens
