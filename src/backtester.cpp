#include "backtester.hpp"
#include "data_source.hpp"
#include <stdexcept>
#include <utility>

namespace trend {

PipelineResult runPipeline(const BarSeries& series, const EngineConfig& cfg) {
    std::string error_msg;
    if (!validateConfig(cfg, error_msg))
        throw std::invalid_argument("invalid engine config: " + error_msg);

    PipelineResult r;
    r.frame = computeIndicators(series, cfg);

    SignalResult signals = detectSignals(series, r.frame, cfg.warmup);
    r.states = std::move(signals.states);
    r.events = std::move(signals.events);

    SimulationResult sim = simulateTrades(r.events, series);
    r.trades = std::move(sim.trades);
    r.open_position = sim.open_position;

    r.summary = summarize(r.trades);
    return r;
}

Backtester::Backtester(const EngineConfig& cfg,
                       const std::string& data_path,
                       const std::string& symbol,
                       const std::string& interval,
                       const std::string& period)
    : cfg_(cfg)
    , data_path_(data_path)
    , symbol_(symbol)
    , interval_(interval.empty() ? "1d" : interval)
    , period_(period.empty() ? "max" : period)
{
}

bool Backtester::run() {
    error_msg_.clear();
    if (!validateConfig(cfg_, error_msg_)) return false;

    DataSource data(data_path_);
    if (!data.load()) {
        error_msg_ = "failed to read " + data_path_ + " (missing file or header without timestamp/open/high/low/close)";
        return false;
    }
    skipped_rows_ = data.skippedRows();

    if (!data.aggregateBars(interval_)) {
        error_msg_ = "unknown interval: " + interval_;
        return false;
    }
    if (!data.trimToPeriod(period_)) {
        error_msg_ = "cannot apply period " + period_;
        return false;
    }
    if (data.empty()) {
        error_msg_ = "no data for " + symbol_ + " (interval " + interval_ + ", period " + period_ + ")";
        return false;
    }

    auto series = BarSeries::create(data.takeBars(), symbol_, interval_, period_, error_msg_);
    if (!series) return false;
    series_ = std::move(*series);

    result_ = runPipeline(series_, cfg_);
    return true;
}

} // namespace trend
