#include "indicators.hpp"
#include "momentum.hpp"
#include <limits>

namespace trend {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

bool windowFits(std::size_t n, int window) {
    return window > 0 && n >= static_cast<std::size_t>(window);
}

} // namespace

std::vector<double> rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (!windowFits(values.size(), window)) return out;
    const std::size_t w = static_cast<std::size_t>(window);
    // Each window is summed from scratch (no running sum).
    for (std::size_t i = w - 1; i < values.size(); ++i) {
        double sum = 0;
        for (std::size_t j = i + 1 - w; j <= i; ++j) sum += values[j];
        out[i] = sum / window;
    }
    return out;
}

std::vector<double> rollingMax(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (!windowFits(values.size(), window)) return out;
    const std::size_t w = static_cast<std::size_t>(window);
    for (std::size_t i = w - 1; i < values.size(); ++i) {
        double m = values[i + 1 - w];
        for (std::size_t j = i + 2 - w; j <= i && !std::isnan(m); ++j) {
            if (std::isnan(values[j])) m = NaN;
            else if (values[j] > m) m = values[j];
        }
        out[i] = m;
    }
    return out;
}

std::vector<double> rollingMin(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), NaN);
    if (!windowFits(values.size(), window)) return out;
    const std::size_t w = static_cast<std::size_t>(window);
    for (std::size_t i = w - 1; i < values.size(); ++i) {
        double m = values[i + 1 - w];
        for (std::size_t j = i + 2 - w; j <= i && !std::isnan(m); ++j) {
            if (std::isnan(values[j])) m = NaN;
            else if (values[j] < m) m = values[j];
        }
        out[i] = m;
    }
    return out;
}

IndicatorFrame computeIndicators(const BarSeries& series, const EngineConfig& cfg) {
    const std::vector<double> closes = series.closes();

    IndicatorFrame frame;
    frame.sma_short = rollingMean(closes, cfg.w_short);
    frame.sma_long = rollingMean(closes, cfg.w_long);
    frame.rsi = createRsiPolicy(cfg.rsi_policy)->compute(closes, cfg.w_momentum);
    frame.vol_avg = rollingMean(series.volumes(), cfg.w_volume);
    frame.resistance = rollingMax(series.highs(), cfg.w_extrema);
    frame.support = rollingMin(series.lows(), cfg.w_extrema);
    return frame;
}

RsiZone classifyRsi(double rsi, double overbought, double oversold) {
    if (std::isnan(rsi)) return RsiZone::Undefined;
    if (rsi >= overbought) return RsiZone::Overbought;
    if (rsi <= oversold) return RsiZone::Oversold;
    return RsiZone::Neutral;
}

const char* rsiZoneName(RsiZone zone) {
    switch (zone) {
        case RsiZone::Oversold: return "oversold";
        case RsiZone::Neutral: return "neutral";
        case RsiZone::Overbought: return "overbought";
        default: return "undefined";
    }
}

} // namespace trend
