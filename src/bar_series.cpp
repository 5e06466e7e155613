#include "bar_series.hpp"
#include <cmath>
#include <utility>

namespace trend {

BarSeries::BarSeries(std::vector<Bar> bars, std::string symbol, std::string interval, std::string period)
    : bars_(std::move(bars))
    , symbol_(std::move(symbol))
    , interval_(std::move(interval))
    , period_(std::move(period))
{
}

bool BarSeries::validateBar(const Bar& bar, std::string& error_msg) {
    const double prices[] = { bar.open, bar.high, bar.low, bar.close };
    for (double p : prices) {
        if (!std::isfinite(p) || p <= 0) {
            error_msg = "non-positive or non-finite price";
            return false;
        }
    }
    if (bar.low > bar.high) {
        error_msg = "low above high";
        return false;
    }
    if (bar.open < bar.low || bar.open > bar.high) {
        error_msg = "open outside [low, high]";
        return false;
    }
    if (bar.close < bar.low || bar.close > bar.high) {
        error_msg = "close outside [low, high]";
        return false;
    }
    return true;
}

std::optional<BarSeries> BarSeries::create(std::vector<Bar> bars,
                                           const std::string& symbol,
                                           const std::string& interval,
                                           const std::string& period,
                                           std::string& error_msg) {
    for (std::size_t i = 0; i < bars.size(); ++i) {
        std::string reason;
        if (!validateBar(bars[i], reason)) {
            error_msg = "bar " + std::to_string(i) + " (" + bars[i].timestamp + "): " + reason;
            return std::nullopt;
        }
        if (i > 0 && !(bars[i - 1].timestamp < bars[i].timestamp)) {
            error_msg = "bar " + std::to_string(i) + " (" + bars[i].timestamp
                + "): timestamp not after previous bar (" + bars[i - 1].timestamp + ")";
            return std::nullopt;
        }
    }
    return BarSeries(std::move(bars), symbol, interval, period);
}

std::vector<double> BarSeries::closes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(b.close);
    return out;
}

std::vector<double> BarSeries::highs() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(b.high);
    return out;
}

std::vector<double> BarSeries::lows() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(b.low);
    return out;
}

std::vector<double> BarSeries::volumes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& b : bars_) out.push_back(static_cast<double>(b.volume));
    return out;
}

} // namespace trend
