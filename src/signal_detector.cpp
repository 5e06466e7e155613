#include "signal_detector.hpp"
#include <algorithm>

namespace trend {

TrendState classifyTrend(double sma_short, double sma_long) {
    if (!isDefined(sma_short) || !isDefined(sma_long)) return TrendState::Undefined;
    return sma_short > sma_long ? TrendState::Bullish : TrendState::Bearish;
}

SignalResult detectSignals(const BarSeries& series, const IndicatorFrame& frame, WarmupPolicy warmup) {
    SignalResult result;
    const std::size_t n = std::min(series.size(), frame.size());
    result.states.assign(series.size(), TrendState::Undefined);

    TrendState prev = TrendState::Undefined;
    for (std::size_t i = 0; i < n; ++i) {
        const TrendState state = classifyTrend(frame.sma_short[i], frame.sma_long[i]);
        result.states[i] = state;
        if (state == TrendState::Undefined) continue;

        if (prev == TrendState::Undefined) {
            // Warm-up bar only seeds the machine. Under BuyIfBullish the seed is
            // not-bullish, so a bullish trend on the next bar emits a BuyCross.
            prev = warmup == WarmupPolicy::BuyIfBullish ? TrendState::Bearish : state;
            continue;
        }

        if (state != prev) {
            CrossoverEvent ev;
            ev.index = i;
            ev.timestamp = series.at(i).timestamp;
            ev.kind = state == TrendState::Bullish ? CrossKind::BuyCross : CrossKind::SellCross;
            ev.price = series.at(i).close;
            ev.sma_short = frame.sma_short[i];
            ev.sma_long = frame.sma_long[i];
            result.events.push_back(ev);
        }
        prev = state;
    }
    return result;
}

const char* trendStateName(TrendState state) {
    switch (state) {
        case TrendState::Bullish: return "bullish";
        case TrendState::Bearish: return "bearish";
        default: return "undefined";
    }
}

const char* crossKindName(CrossKind kind) {
    return kind == CrossKind::BuyCross ? "BUY" : "SELL";
}

} // namespace trend
