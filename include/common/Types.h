#pragma once

#include <string>
#include <optional>
#include <utility>

namespace pricelens {

using Price = double;
using Volume = double;

enum class SignalType { BUY, SELL, HOLD };

enum class MarketTrend { UPTREND, DOWNTREND, SIDEWAYS, BREAKOUT, UNKNOWN };

enum class VolumeProfile { HIGH, NORMAL, LOW, UNKNOWN };

// 시그널을 만든 패턴
enum class SignalPattern {
    NONE,
    RANGE_BREAKOUT,
    TWO_LEG_PULLBACK,
    WEDGE_BREAKOUT,
    TRENDLINE_BREAK,
    FAILED_BREAKOUT,
    KEY_LEVEL_TEST,
    REVERSAL_BAR
};

struct Bar {
    std::string symbol;
    long long timestamp;    // epoch ms
    double open;
    double high;
    double low;
    double close;
    double volume;
    std::optional<double> vwap;
    std::optional<long long> trade_count;

    Bar() : timestamp(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(std::string s, long long t, double o, double h, double l, double c, double v)
        : symbol(std::move(s)), timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

struct TradingSignal {
    std::string symbol;
    SignalType signal_type;
    double confidence;          // 0.0 ~ 1.0
    double price;
    long long timestamp;        // epoch ms
    std::string reason;
    double stop_loss;           // 보호 손절가 (BUY: 최근 저가, SELL: 최근 고가)
    SignalPattern pattern;

    TradingSignal()
        : signal_type(SignalType::HOLD)
        , confidence(0.0)
        , price(0.0)
        , timestamp(0)
        , stop_loss(0.0)
        , pattern(SignalPattern::NONE)
    {}
};

struct MarketContext {
    std::string symbol;
    double current_price;
    MarketTrend trend;
    double volatility;          // percent
    VolumeProfile volume_profile;

    MarketContext()
        : current_price(0.0)
        , trend(MarketTrend::UNKNOWN)
        , volatility(0.0)
        , volume_profile(VolumeProfile::UNKNOWN)
    {}
};

const char* toString(SignalType type);
const char* toString(MarketTrend trend);
const char* toString(VolumeProfile profile);
const char* toString(SignalPattern pattern);

} // namespace pricelens
