#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>
#include <cstddef>
#include <utility>

namespace trend {

/// Loads OHLCV bars from a CSV file and normalizes them for BarSeries::create.
/// CSV: expected columns timestamp/date, open, high, low, close [, volume] (header names case-insensitive).
/// Rows that fail to parse (including a timestamp without a YYYY-MM-DD date) or violate
/// low <= {open, close} <= high are skipped and counted.
/// After loading, bars are sorted by timestamp and duplicate timestamps collapse to the last row.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from CSV file. Returns false if the file cannot be opened or the header lacks a required column.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::vector<Bar> takeBars() { return std::move(bars_); }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    std::size_t skippedRows() const { return skipped_rows_; }

    /// Get bar at index (0-based). Throws std::out_of_range.
    const Bar& at(std::size_t i) const { return bars_.at(i); }

    /// Aggregate finer bars into the given interval: "1m" (no-op), "5m", "15m", "30m", "1h", "1d", "1wk".
    /// OHLCV: open=first, high=max, low=min, close=last, volume=sum. Returns false on an unknown interval.
    bool aggregateBars(const std::string& interval);

    /// Keep only bars within the lookback period ending at the last bar:
    /// "1d", "5d", "1mo", "3mo", "6mo", "1y", "2y", "5y" (calendar days) or "max" (no-op).
    /// Returns false on an unknown period or an unparseable last timestamp.
    bool trimToPeriod(const std::string& period);

    static bool isKnownInterval(const std::string& interval);
    static bool isKnownPeriod(const std::string& period);

private:
    std::string filepath_;
    std::vector<Bar> bars_;
    std::size_t skipped_rows_{0};

    std::optional<Bar> parseLine(const std::string& line,
                                 const std::vector<std::string>& headers) const;
    void normalize();
};

} // namespace trend
