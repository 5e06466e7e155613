#include "performance.hpp"

namespace trend {

PerformanceSummary summarize(const std::vector<Trade>& trades) {
    PerformanceSummary s;
    s.trade_count = static_cast<int>(trades.size());
    if (trades.empty()) return s;

    for (const auto& t : trades) {
        if (t.profit_pct > 0) ++s.winning_trades;
        s.total_return_pct += t.profit_pct;
    }
    s.has_trades = true;
    s.win_rate = static_cast<double>(s.winning_trades) / s.trade_count;
    s.avg_profit_pct = s.total_return_pct / s.trade_count;
    return s;
}

} // namespace trend
