#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>
#include <cstddef>

namespace trend {

/// Immutable, validated bar series for one instrument at one sampling interval.
/// Timestamps are strictly increasing; every bar satisfies low <= {open, close} <= high
/// with positive finite prices.
class BarSeries {
public:
    /// Validate bars and build the series. Returns nullopt and sets error_msg on the first bad bar.
    /// symbol, interval and period are opaque tags carried for reporting.
    static std::optional<BarSeries> create(std::vector<Bar> bars,
                                           const std::string& symbol,
                                           const std::string& interval,
                                           const std::string& period,
                                           std::string& error_msg);

    /// Empty series with no tags (useful as a default value).
    BarSeries() = default;

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& at(std::size_t i) const { return bars_.at(i); }
    const Bar& back() const { return bars_.back(); }

    const std::string& symbol() const { return symbol_; }
    const std::string& interval() const { return interval_; }
    const std::string& period() const { return period_; }

    std::vector<double> closes() const;
    std::vector<double> highs() const;
    std::vector<double> lows() const;
    std::vector<double> volumes() const;

    /// Check a single bar: finite positive prices, OHLC ordering. Returns false and sets error_msg.
    static bool validateBar(const Bar& bar, std::string& error_msg);

private:
    BarSeries(std::vector<Bar> bars, std::string symbol, std::string interval, std::string period);

    std::vector<Bar> bars_;
    std::string symbol_;
    std::string interval_;
    std::string period_;
};

} // namespace trend
