#include "analytics/RollingWindow.h"
#include "TestBars.h"

#include <iostream>
#include <stdexcept>

using pricelens::analytics::RollingWindow;
using namespace pricelens::testing;

int main() {
    bool threw = false;
    try {
        RollingWindow invalid(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] capacity 0 should throw\n";
        return 1;
    }

    RollingWindow window(5);
    if (!window.empty() || window.latest().has_value() || !window.snapshot(3).empty()) {
        std::cerr << "[TEST] new window should be empty\n";
        return 1;
    }

    const auto bars = ascendingBars(12);
    for (std::size_t i = 0; i < bars.size(); ++i) {
        window.push(bars[i]);
        if (window.size() > window.capacity()) {
            std::cerr << "[TEST] size exceeded capacity at push " << i << "\n";
            return 1;
        }
    }

    if (window.size() != 5) {
        std::cerr << "[TEST] expected size 5, got " << window.size() << "\n";
        return 1;
    }

    // 가장 오래된 봉부터 밀려남
    const auto all = window.snapshot(100);
    if (all.size() != 5) {
        std::cerr << "[TEST] snapshot(100) should return 5 bars\n";
        return 1;
    }
    for (std::size_t i = 0; i < all.size(); ++i) {
        if (all[i].timestamp != bars[7 + i].timestamp) {
            std::cerr << "[TEST] FIFO order broken at " << i << "\n";
            return 1;
        }
    }

    const auto last_two = window.snapshot(2);
    if (last_two.size() != 2 || last_two.back().close != bars.back().close ||
        last_two.front().close != bars[10].close) {
        std::cerr << "[TEST] snapshot(2) should return the two latest bars\n";
        return 1;
    }

    if (!window.latest() || window.latest()->timestamp != bars.back().timestamp) {
        std::cerr << "[TEST] latest() mismatch\n";
        return 1;
    }

    std::cout << "[TEST] RollingWindow PASSED\n";
    return 0;
}
