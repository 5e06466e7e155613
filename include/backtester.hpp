#pragma once

#include "bar_series.hpp"
#include "config.hpp"
#include "indicators.hpp"
#include "signal_detector.hpp"
#include "simulator.hpp"
#include "performance.hpp"
#include <vector>
#include <string>
#include <optional>

namespace trend {

/// Everything one pipeline invocation produces. Recomputed from scratch on every run.
struct PipelineResult {
    IndicatorFrame frame;
    std::vector<TrendState> states;
    std::vector<CrossoverEvent> events;
    std::vector<Trade> trades;                   // closed trades only
    std::optional<OpenPosition> open_position;   // trailing position, display only
    PerformanceSummary summary;
};

/// BarSeries -> indicators -> signals -> trades -> summary.
/// Pure and idempotent: the same (series, cfg) always yields identical output.
/// Throws std::invalid_argument (naming the parameter) if cfg is invalid, before any computation.
PipelineResult runPipeline(const BarSeries& series, const EngineConfig& cfg);

/// Orchestrates one run from a CSV file: load, resample, trim to the lookback period,
/// build the series and run the pipeline.
class Backtester {
public:
    /// interval: resample target ("1m" keeps bars as loaded). period: lookback ("max" keeps everything).
    Backtester(const EngineConfig& cfg,
               const std::string& data_path,
               const std::string& symbol,
               const std::string& interval = "1d",
               const std::string& period = "max");

    /// Run the backtest. Returns false (see errorMessage()) if the config is invalid,
    /// data failed to load, or no bars remain. The pipeline is not run in that case.
    bool run();

    const EngineConfig& config() const { return cfg_; }
    const BarSeries& series() const { return series_; }
    const PipelineResult& result() const { return result_; }
    const std::string& errorMessage() const { return error_msg_; }
    std::size_t skippedRows() const { return skipped_rows_; }

private:
    EngineConfig cfg_;
    std::string data_path_;
    std::string symbol_;
    std::string interval_;
    std::string period_;

    BarSeries series_;
    PipelineResult result_;
    std::string error_msg_;
    std::size_t skipped_rows_{0};
};

} // namespace trend
