#pragma once

#include "backtester.hpp"
#include "bar_series.hpp"
#include <string>
#include <ostream>
#include <iostream>

namespace trend {

/// Presents one pipeline run: console summary plus CSV / text / JSON exports.
class Report {
public:
    /// params is included in report output (e.g. describeConfig(cfg)).
    Report(const BarSeries& series, const PipelineResult& result, const std::string& params = "");

private:
    void printReportHeader(std::ostream& out) const;
    void printBody(std::ostream& out) const;

public:
    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write closed trades CSV. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write bars + indicator columns CSV (undefined values are empty cells). Returns false on failure.
    bool writeIndicators(const std::string& filepath) const;

    /// Write crossover events CSV. Returns false on failure.
    bool writeSignals(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    /// Write bars, indicators, events and trades as JSON for the chart viewer (session.json).
    bool writeSessionJson(const std::string& filepath) const;

private:
    const BarSeries& series_;
    const PipelineResult& result_;
    std::string params_;
};

} // namespace trend
