#pragma once

#include "bar.hpp"
#include "bar_series.hpp"
#include "signal_detector.hpp"
#include <vector>
#include <string>
#include <optional>
#include <cstddef>

namespace trend {

/// Closed round-trip trade (long only).
struct Trade {
    std::string entry_time;
    std::string exit_time;
    std::size_t entry_index{0};
    std::size_t exit_index{0};
    double entry_price{0};
    double exit_price{0};
    double profit_pct{0};  // (exit - entry) / entry * 100
};

/// Position still open at the end of the series. Display only: never part of the ledger.
struct OpenPosition {
    std::string entry_time;
    std::size_t entry_index{0};
    double entry_price{0};
    double last_price{0};
    double unrealized_pct{0};
};

enum class PositionState { Flat, Long };

/// Replays crossover events into a flat/long trade ledger.
/// BuyCross while flat opens a position at the event price; BuyCross while long is ignored (no pyramiding).
/// SellCross while long closes it and records a Trade; SellCross while flat is ignored (no shorting).
class Simulator {
public:
    Simulator() = default;

    void onEvent(const CrossoverEvent& ev);

    /// Mark any still-open position at the last bar's close. Call once after the last event.
    void finish(const Bar& last_bar);

    PositionState state() const { return state_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::optional<OpenPosition>& openPosition() const { return open_; }

private:
    PositionState state_{PositionState::Flat};
    std::string entry_time_;
    std::size_t entry_index_{0};
    double entry_price_{0};

    std::vector<Trade> trades_;
    std::optional<OpenPosition> open_;
};

struct SimulationResult {
    std::vector<Trade> trades;
    std::optional<OpenPosition> open_position;
};

/// Run a Simulator over all events and mark the trailing position against the series' last bar.
SimulationResult simulateTrades(const std::vector<CrossoverEvent>& events, const BarSeries& series);

double profitPct(double entry_price, double exit_price);

} // namespace trend
