#pragma once

#include "simulator.hpp"
#include <vector>

namespace trend {

/// Aggregate statistics over closed trades only.
struct PerformanceSummary {
    int trade_count{0};
    int winning_trades{0};        // profit_pct > 0
    double total_return_pct{0};   // sum of profit_pct
    double win_rate{0};           // winning_trades / trade_count, in [0, 1]
    double avg_profit_pct{0};     // mean profit_pct
    bool has_trades{false};       // false => "no trades"; all figures are zero
};

/// Reduce a closed-trade ledger. An empty ledger yields the "no trades" summary.
PerformanceSummary summarize(const std::vector<Trade>& trades);

} // namespace trend
