#include "core/events/EventChannel.h"
#include "monitor/StatusBoard.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using namespace pricelens;
using pricelens::core::EventChannel;
using pricelens::core::PipelineEvent;
using pricelens::core::PipelineEventType;
using pricelens::monitor::StatusBoard;

namespace {

int failures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "[TEST] " << message << "\n";
        ++failures;
    }
}

PipelineEvent makeEvent(PipelineEventType type, const std::string& symbol, long long ts,
                        nlohmann::json payload = nlohmann::json::object()) {
    PipelineEvent event;
    event.type = type;
    event.symbol = symbol;
    event.ts_ms = ts;
    event.payload = std::move(payload);
    return event;
}

} // namespace

int main() {
    {
        bool threw = false;
        try {
            EventChannel channel(0);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "zero capacity should throw");
    }

    // 가득 차면 가장 오래된 이벤트 폐기
    {
        EventChannel channel(3);
        for (int i = 0; i < 5; ++i) {
            channel.publish(makeEvent(PipelineEventType::MARKET_ANALYSIS_UPDATED, "TEST", i));
        }
        expect(channel.size() == 3, "channel should stay at capacity");
        expect(channel.droppedCount() == 2, "two events should be dropped");
        expect(channel.lastSeq() == 5, "seq should count every publish");

        const auto events = channel.drain();
        expect(events.size() == 3, "drain should return every queued event");
        if (events.size() == 3) {
            expect(events[0].seq == 3 && events[2].seq == 5, "oldest events should be the ones dropped");
            expect(events[0].ts_ms == 2, "payload order should be preserved");
        }
        expect(channel.size() == 0 && !channel.tryPop(), "channel should be empty after drain");
    }

    {
        EventChannel channel;
        const auto start = std::chrono::steady_clock::now();
        expect(!channel.waitPop(std::chrono::milliseconds(20)), "waitPop should time out on an empty channel");
        expect(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(15), "waitPop returned too early");
    }

    // producer/consumer
    {
        EventChannel channel(10000);
        const int total = 2000;
        std::thread producer([&channel]() {
            for (int i = 0; i < total; ++i) {
                channel.publish(makeEvent(PipelineEventType::SIGNAL_GENERATED, "TEST", i));
            }
        });

        int received = 0;
        std::uint64_t prev_seq = 0;
        bool ordered = true;
        while (received < total) {
            auto event = channel.waitPop(std::chrono::milliseconds(1000));
            if (!event) break;
            if (event->seq <= prev_seq) ordered = false;
            prev_seq = event->seq;
            ++received;
        }
        producer.join();

        expect(received == total, "consumer should receive every event");
        expect(ordered, "events should arrive in seq order");
    }

    // StatusBoard 직접 주입
    {
        StatusBoard board;
        board.publish(makeEvent(PipelineEventType::MARKET_ANALYSIS_UPDATED, "AAPL", 1000,
                                {{"price", 123.5}, {"trend", "UPTREND"}, {"structure", "strong_trend_up"},
                                 {"volatility", 2.25}, {"volume_profile", "NORMAL"}}));
        board.publish(makeEvent(PipelineEventType::SIGNAL_GENERATED, "AAPL", 1000,
                                {{"signal_type", "BUY"}, {"confidence", 0.8}, {"reason", "breakout"}}));
        board.publish(makeEvent(PipelineEventType::SIGNAL_REJECTED, "AAPL", 2000,
                                {{"reason", "duplicate_signal"}}));

        const auto status = board.status("AAPL");
        expect(status.has_value(), "AAPL status should exist");
        if (status) {
            expect(status->price == 123.5 && status->trend == "UPTREND", "analysis fields not applied");
            expect(status->last_signal_type == "BUY" && status->last_signal_confidence == 0.8, "signal fields not applied");
            expect(status->signal_count == 1 && status->rejected_count == 1, "counters mismatch");
            expect(status->last_update_ms == 2000, "last_update_ms should track the newest event");
        }
        expect(!board.status("MSFT"), "unknown symbol should have no status");
    }

    // 채널 경유 pump
    {
        EventChannel channel;
        StatusBoard board;
        channel.publish(makeEvent(PipelineEventType::ERROR_OCCURRED, "MSFT", 10, {{"message", "bad bar"}}));
        channel.publish(makeEvent(PipelineEventType::MARKET_ANALYSIS_UPDATED, "AAPL", 20, {{"price", 50.0}}));

        expect(board.pump(channel) == 2, "pump should apply both events");
        expect(channel.size() == 0, "pump should drain the channel");

        const auto msft = board.status("MSFT");
        expect(msft && msft->error_count == 1 && msft->last_error == "bad bar", "error not recorded");

        const auto snapshot = board.snapshot();
        expect(snapshot.size() == 2 && snapshot[0].symbol == "AAPL", "snapshot should be sorted by symbol");

        const auto json = board.toJson();
        expect(json.contains("AAPL") && json["AAPL"]["price"].get<double>() == 50.0, "toJson mismatch");
    }

    // 이벤트 타입 문자열
    {
        expect(std::string(core::toString(PipelineEventType::SIGNAL_REJECTED)) == "SIGNAL_REJECTED",
               "toString mismatch");
        expect(core::eventTypeFromString("ERROR_OCCURRED") == PipelineEventType::ERROR_OCCURRED,
               "eventTypeFromString mismatch");
        bool threw = false;
        try {
            core::eventTypeFromString("NOPE");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "unknown event type should throw");

        auto event = makeEvent(PipelineEventType::SIGNAL_GENERATED, "AAPL", 42, {{"confidence", 0.7}});
        event.seq = 9;
        const auto json = core::toJson(event);
        expect(json["seq"].get<std::uint64_t>() == 9 && json["type"] == "SIGNAL_GENERATED" &&
               json["payload"]["confidence"].get<double>() == 0.7, "toJson mismatch");
    }

    if (failures > 0) {
        std::cerr << "[TEST] EventChannel FAILED (" << failures << ")\n";
        return 1;
    }
    std::cout << "[TEST] EventChannel PASSED\n";
    return 0;
}
