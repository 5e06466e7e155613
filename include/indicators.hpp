#pragma once

#include "bar_series.hpp"
#include "config.hpp"
#include <vector>
#include <cmath>
#include <cstddef>

namespace trend {

/// Indicator columns aligned 1:1 with a BarSeries. Undefined entries (window not yet full) are NaN.
struct IndicatorFrame {
    std::vector<double> sma_short;
    std::vector<double> sma_long;
    std::vector<double> rsi;
    std::vector<double> vol_avg;
    std::vector<double> resistance;  // rolling max of high
    std::vector<double> support;     // rolling min of low

    std::size_t size() const { return sma_short.size(); }
};

inline bool isDefined(double v) { return !std::isnan(v); }

/// Mean of values[i-window+1..i]; NaN for i < window-1 or when the window holds a NaN.
std::vector<double> rollingMean(const std::vector<double>& values, int window);
/// Max of values[i-window+1..i]; NaN while the window is not full.
std::vector<double> rollingMax(const std::vector<double>& values, int window);
/// Min of values[i-window+1..i]; NaN while the window is not full.
std::vector<double> rollingMin(const std::vector<double>& values, int window);

/// Compute every indicator column. Short series yield all-NaN columns, never an error.
/// Windows must already be validated (see validateConfig).
IndicatorFrame computeIndicators(const BarSeries& series, const EngineConfig& cfg);

/// RSI reference bands drawn at 70 / 30.
enum class RsiZone { Undefined, Oversold, Neutral, Overbought };

RsiZone classifyRsi(double rsi, double overbought = 70.0, double oversold = 30.0);
const char* rsiZoneName(RsiZone zone);

} // namespace trend
