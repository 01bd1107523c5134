#include "core/events/EventChannel.h"
#include "engine/PipelineRegistry.h"
#include "engine/PriceActionPipeline.h"
#include "TestBars.h"

#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace pricelens;
using namespace pricelens::testing;
using pricelens::core::EventChannel;
using pricelens::core::PipelineEventType;
using pricelens::engine::PipelineConfig;
using pricelens::engine::PipelineRegistry;
using pricelens::engine::PriceActionPipeline;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] " << message << "\n";
        ++failures;
    }
}

std::size_t countEvents(const std::vector<core::PipelineEvent>& events, PipelineEventType type) {
    std::size_t count = 0;
    for (const auto& event : events) {
        if (event.type == type) ++count;
    }
    return count;
}

// publish 안에서 같은 파이프라인을 다시 조회하는 sink
class ReentrantSink : public core::IEventSink {
public:
    void attach(const PriceActionPipeline* pipeline) { pipeline_ = pipeline; }

    void publish(core::PipelineEvent event) override {
        if (pipeline_ && event.type == PipelineEventType::SIGNAL_GENERATED) {
            seen_signal = pipeline_->lastSignal();
            seen_bar_count = pipeline_->barCount();
        }
        ++published;
    }

    std::optional<TradingSignal> seen_signal;
    std::size_t seen_bar_count = 0;
    std::size_t published = 0;

private:
    const PriceActionPipeline* pipeline_ = nullptr;
};

// std::exception 이 아닌 값을 던지는 sink
class ThrowingSink : public core::IEventSink {
public:
    void publish(core::PipelineEvent) override {
        throw 42;
    }
};

} // namespace

int main() {
    // 생성자 검증
    {
        PipelineConfig bad;
        bad.buffer_size = 0;
        bool threw = false;
        try {
            PriceActionPipeline pipeline("TEST", bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "buffer_size 0 should be rejected");

        PipelineConfig bad_risk;
        bad_risk.sizing.risk_per_trade = 1.5;
        threw = false;
        try {
            PriceActionPipeline pipeline("TEST", bad_risk);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "risk_per_trade outside (0,1] should be rejected");

        threw = false;
        try {
            PriceActionPipeline pipeline("");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "empty symbol should be rejected");
    }

    // 1분 간격 상승 봉 25개: 쿨다운(300초) 안의 신호는 중복으로 거절
    //  bar 19 통과, bar 20~23 거절, bar 24 (정확히 300초 뒤) 통과
    {
        auto channel = std::make_shared<EventChannel>();
        PriceActionPipeline pipeline("TEST", PipelineConfig(), channel);
        const auto bars = ascendingBars(25);

        std::vector<TradingSignal> signals;
        for (std::size_t i = 0; i < bars.size(); ++i) {
            const auto signal = pipeline.processNewBar(bars[i]);
            if (i < 19) {
                expect(!signal, "no signal expected before 20 bars");
            }
            if (signal) signals.push_back(*signal);
        }

        expect(signals.size() == 2, "breakouts at bar 20 and 300s later should pass, got " +
                                    std::to_string(signals.size()));
        if (signals.size() == 2) {
            const auto& first = signals.front();
            expect(first.signal_type == SignalType::BUY && near(first.confidence, 0.8), "first signal should be BUY 0.8");
            expect(first.reason.find("breakout") != std::string::npos &&
                   first.reason.find("uptrend") != std::string::npos, "reason should mention breakout and uptrend");
            expect(first.timestamp == bars[19].timestamp, "first signal should fire on the 20th bar");
            expect(signals[1].timestamp == bars[24].timestamp, "second signal should fire exactly 300s later");
        }

        const auto events = channel->drain();
        expect(countEvents(events, PipelineEventType::MARKET_ANALYSIS_UPDATED) == 6, "6 analyses expected (bars 20..25)");
        expect(countEvents(events, PipelineEventType::SIGNAL_GENERATED) == 2, "two SIGNAL_GENERATED expected");
        expect(countEvents(events, PipelineEventType::SIGNAL_REJECTED) == 4, "breakouts inside the cooldown should be rejected");
        for (const auto& event : events) {
            if (event.type == PipelineEventType::SIGNAL_REJECTED) {
                expect(event.payload.value("reason", std::string()) == "duplicate_signal", "rejection should be duplicate_signal");
            }
        }

        expect(pipeline.lastSignal() && pipeline.lastSignal()->timestamp == bars[24].timestamp,
               "last signal should be the latest accepted one");
        expect(pipeline.lastContext().has_value() && pipeline.lastMarketContext().has_value(),
               "last analysis should be kept");
        expect(pipeline.barCount() == 25, "bar count mismatch");

        const auto recent = pipeline.recentBars(3);
        expect(recent.size() == 3 && recent.back().timestamp == bars.back().timestamp, "recentBars(3) mismatch");
    }

    // 쿨다운 경계: 299초 거절, 300초 통과
    {
        auto bars = ascendingBars(22);
        bars[20].timestamp = bars[19].timestamp + 299000;
        bars[21].timestamp = bars[19].timestamp + 300000;

        PriceActionPipeline pipeline("TEST");
        std::vector<std::optional<TradingSignal>> results;
        for (const auto& bar : bars) {
            results.push_back(pipeline.processNewBar(bar));
        }
        expect(results[19].has_value(), "first breakout should pass");
        expect(!results[20].has_value(), "same type 299s later should be rejected");
        expect(results[21].has_value() && results[21]->timestamp == bars[21].timestamp,
               "same type 300s after the accepted signal should pass");
    }

    // 5분 간격이면 매 봉 신호 통과
    {
        PriceActionPipeline pipeline("TEST");
        std::size_t accepted = 0;
        for (const auto& bar : ascendingBars(25, 5 * kMinuteMs)) {
            if (pipeline.processNewBar(bar)) ++accepted;
        }
        expect(accepted == 6, "300s spacing should accept every breakout, got " + std::to_string(accepted));
    }

    // 잘못된 봉은 ERROR_OCCURRED, 버퍼 변화 없음
    {
        auto channel = std::make_shared<EventChannel>();
        PriceActionPipeline pipeline("TEST", PipelineConfig(), channel);
        const auto bars = ascendingBars(3);
        pipeline.processNewBar(bars[0]);
        pipeline.processNewBar(bars[1]);

        expect(!pipeline.processNewBar(bars[1]), "repeated timestamp should yield no signal");
        expect(!pipeline.processNewBar(makeBar(bars[2].timestamp, 100, 99, 101, 100)), "high<low should yield no signal");
        expect(!pipeline.processNewBar(makeBar(bars[2].timestamp, 100, 101, 99, 100, 10, "OTHER")), "foreign symbol should yield no signal");
        expect(!pipeline.processNewBar(makeBar(bars[2].timestamp, -1, 101, -2, 100)), "negative price should yield no signal");
        expect(!pipeline.processNewBar(makeBar(bars[2].timestamp, 100, 101, 99, 100, -5)), "negative volume should yield no signal");
        expect(pipeline.barCount() == 2, "invalid bars must not be stored");

        const auto events = channel->drain();
        expect(countEvents(events, PipelineEventType::ERROR_OCCURRED) == 5, "each invalid bar should publish ERROR_OCCURRED");

        pipeline.processNewBar(bars[2]);
        expect(pipeline.barCount() == 3, "valid bar after errors should be stored");
    }

    // 현재가: 더 최신 체결가 우선
    {
        PriceActionPipeline pipeline("TEST");
        expect(pipeline.currentPrice() == 0.0, "empty pipeline price should be 0");

        const auto bars = ascendingBars(2);
        pipeline.processNewBar(bars[0]);
        pipeline.processNewBar(bars[1]);
        expect(pipeline.currentPrice() == bars[1].close, "price should be the last close");

        pipeline.updateTradePrice(101.7, bars[1].timestamp + 1000);
        expect(pipeline.currentPrice() == 101.7, "newer trade should override the close");

        pipeline.updateTradePrice(-1.0, bars[1].timestamp + 2000);
        expect(pipeline.currentPrice() == 101.7, "invalid trade price should be ignored");

        pipeline.processNewBar(makeBar(bars[1].timestamp + kMinuteMs, 101.5, 102.5, 101.2, 102.2));
        expect(pipeline.currentPrice() == 102.2, "newer bar should override an older trade");
    }

    // 버퍼 용량
    {
        PipelineConfig config;
        config.buffer_size = 30;
        config.analysis_bars = 25;
        PriceActionPipeline pipeline("TEST", config);
        for (const auto& bar : ascendingBars(40)) {
            pipeline.processNewBar(bar);
        }
        expect(pipeline.barCount() == 30, "buffer should stay at capacity");
        expect(pipeline.recentBars(100).front().close == 110.0, "oldest bars should be evicted first");
    }

    // warm-up
    {
        const auto bars = ascendingBars(26);
        std::vector<Bar> warmup(bars.begin(), bars.begin() + 25);
        PriceActionPipeline pipeline("TEST", PipelineConfig(), nullptr, warmup);
        expect(pipeline.barCount() == 25, "warm-up bars should be buffered");
        expect(!pipeline.lastContext(), "warm-up should not analyze");

        const auto signal = pipeline.processNewBar(bars[25]);
        expect(signal && signal->signal_type == SignalType::BUY, "first live bar after warm-up should signal");
        expect(pipeline.lastContext().has_value(), "live bar should analyze");

        const auto plan = pipeline.planOrder(*signal, 100000.0, 0.0);
        expect(plan.actionable() && plan.side == execution::OrderSide::BUY, "plan after BUY should buy");
    }

    // 쓰기 1 + 읽기 여러 스레드
    {
        PriceActionPipeline pipeline("TEST");
        const auto bars = ascendingBars(300);
        std::atomic<bool> done{false};
        std::atomic<bool> bad_read{false};

        std::vector<std::thread> readers;
        for (int r = 0; r < 3; ++r) {
            readers.emplace_back([&]() {
                while (!done.load()) {
                    const auto recent = pipeline.recentBars(5);
                    for (std::size_t i = 1; i < recent.size(); ++i) {
                        if (recent[i].timestamp <= recent[i - 1].timestamp) bad_read = true;
                    }
                    if (pipeline.barCount() > pipeline.config().buffer_size) bad_read = true;
                    (void)pipeline.currentPrice();
                }
            });
        }

        for (const auto& bar : bars) {
            pipeline.processNewBar(bar);
        }
        done = true;
        for (auto& t : readers) t.join();

        expect(!bad_read.load(), "readers should always see an ordered, bounded buffer");
        expect(pipeline.barCount() == 300, "writer should store every bar");
    }

    // sink 가 publish 중에 파이프라인을 다시 호출해도 막히지 않음
    {
        auto sink = std::make_shared<ReentrantSink>();
        PriceActionPipeline pipeline("TEST", PipelineConfig(), sink);
        sink->attach(&pipeline);

        const auto bars = ascendingBars(20);
        std::optional<TradingSignal> signal;
        for (const auto& bar : bars) {
            signal = pipeline.processNewBar(bar);
        }
        expect(signal.has_value(), "20th bar should signal");
        expect(sink->seen_signal && sink->seen_signal->timestamp == bars[19].timestamp,
               "sink should see the accepted signal as lastSignal");
        expect(sink->seen_bar_count == 20, "sink should see the stored bar");
        expect(sink->published == 2, "analysis and signal events should be published");
    }

    // sink 예외는 processNewBar 밖으로 나가지 않음
    {
        PriceActionPipeline pipeline("TEST", PipelineConfig(), std::make_shared<ThrowingSink>());
        const auto bars = ascendingBars(21);
        bool threw = false;
        std::optional<TradingSignal> signal;
        try {
            for (const auto& bar : bars) {
                signal = pipeline.processNewBar(bar);
            }
            pipeline.processNewBar(bars[0]);
        } catch (...) {
            threw = true;
        }
        expect(!threw, "non-standard sink exceptions must not escape processNewBar");
        expect(pipeline.barCount() == 21, "bars should still be stored when the sink throws");
        expect(pipeline.lastSignal().has_value(), "signal state should survive a throwing sink");
    }

    // registry
    {
        auto channel = std::make_shared<EventChannel>();
        PipelineRegistry registry(PipelineConfig(), channel);
        const auto aapl = ascendingBars(3, kMinuteMs, "AAPL");
        const auto msft = ascendingBars(2, kMinuteMs, "MSFT");
        for (const auto& bar : aapl) registry.onBar(bar);
        for (const auto& bar : msft) registry.onBar(bar);

        expect(registry.size() == 2, "registry should hold one pipeline per symbol");
        expect(registry.get("AAPL") && registry.get("AAPL")->barCount() == 3, "AAPL pipeline bar count mismatch");
        expect(registry.get("MSFT") && registry.get("MSFT")->barCount() == 2, "MSFT pipeline bar count mismatch");
        expect(!registry.get("TSLA"), "unknown symbol should return null");
        expect(!registry.onTrade("TSLA", 10.0, kBaseTs), "trade for unknown symbol should return false");
        expect(registry.onTrade("AAPL", 250.0, aapl.back().timestamp + 1), "trade for known symbol should return true");
        expect(registry.get("AAPL")->currentPrice() == 250.0, "trade should update the pipeline price");

        const auto symbols = registry.symbols();
        expect(symbols.size() == 2 && symbols[0] == "AAPL" && symbols[1] == "MSFT", "symbols should be sorted");

        auto existing = registry.create("AAPL", ascendingBars(5, kMinuteMs, "AAPL"));
        expect(existing->barCount() == 3, "create on existing symbol should return the existing pipeline");
    }

    if (failures > 0) {
        std::cerr << "[TEST] Pipeline FAILED (" << failures << ")\n";
        return 1;
    }
    std::cout << "[TEST] Pipeline PASSED\n";
    return 0;
}
