#pragma once

#include "bar_series.hpp"
#include "config.hpp"
#include "indicators.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace trend {

/// Per-bar trend: Bullish when sma_short > sma_long, Bearish otherwise, Undefined while either SMA is NaN.
enum class TrendState { Undefined, Bullish, Bearish };

enum class CrossKind { BuyCross, SellCross };

/// Trend flip at a bar, tagged by the state entered (Bullish => BuyCross, Bearish => SellCross).
struct CrossoverEvent {
    std::size_t index{0};
    std::string timestamp;
    CrossKind kind{CrossKind::BuyCross};
    double price{0};      // bar close
    double sma_short{0};
    double sma_long{0};
};

struct SignalResult {
    std::vector<TrendState> states;        // aligned with the series
    std::vector<CrossoverEvent> events;    // in bar order
};

/// Never compares undefined inputs.
TrendState classifyTrend(double sma_short, double sma_long);

/// Run the two-state trend machine over the frame and collect crossover events.
/// The comparison is only evaluated on bars where both SMAs are defined; each flip
/// relative to the previous defined bar emits exactly one event.
SignalResult detectSignals(const BarSeries& series, const IndicatorFrame& frame, WarmupPolicy warmup);

const char* trendStateName(TrendState state);
const char* crossKindName(CrossKind kind);

} // namespace trend
