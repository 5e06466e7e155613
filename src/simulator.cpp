#include "simulator.hpp"

namespace trend {

double profitPct(double entry_price, double exit_price) {
    return (entry_price != 0) ? (exit_price - entry_price) / entry_price * 100.0 : 0;
}

void Simulator::onEvent(const CrossoverEvent& ev) {
    open_.reset();

    if (ev.kind == CrossKind::BuyCross) {
        if (state_ == PositionState::Long) return;
        entry_time_ = ev.timestamp;
        entry_index_ = ev.index;
        entry_price_ = ev.price;
        state_ = PositionState::Long;
        return;
    }

    if (state_ == PositionState::Flat) return;

    Trade t;
    t.entry_time = entry_time_;
    t.entry_index = entry_index_;
    t.entry_price = entry_price_;
    t.exit_time = ev.timestamp;
    t.exit_index = ev.index;
    t.exit_price = ev.price;
    t.profit_pct = profitPct(t.entry_price, t.exit_price);
    trades_.push_back(t);
    state_ = PositionState::Flat;
}

void Simulator::finish(const Bar& last_bar) {
    open_.reset();
    if (state_ != PositionState::Long) return;

    OpenPosition p;
    p.entry_time = entry_time_;
    p.entry_index = entry_index_;
    p.entry_price = entry_price_;
    p.last_price = last_bar.close;
    p.unrealized_pct = profitPct(entry_price_, last_bar.close);
    open_ = p;
}

SimulationResult simulateTrades(const std::vector<CrossoverEvent>& events, const BarSeries& series) {
    Simulator sim;
    for (const auto& ev : events)
        sim.onEvent(ev);
    if (!series.empty())
        sim.finish(series.back());
    return { sim.trades(), sim.openPosition() };
}

} // namespace trend
