#include "report.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace trend {

namespace {

void writeCsvQuoted(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\"\"";
        else out << c;
    }
    out << '"';
}

void writeJsonString(std::ostream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        if (c == '"') out << "\\\"";
        else if (c == '\\') out << "\\\\";
        else if (c == '\n') out << "\\n";
        else if (c == '\r') out << "\\r";
        else if (c == '\t') out << "\\t";
        else if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out << buf;
        }
        else out << c;
    }
    out << '"';
}

// Undefined (NaN) indicator values: empty CSV cell.
void writeCsvValue(std::ostream& out, double v) {
    if (isDefined(v)) out << v;
}

// Undefined (NaN) indicator values: JSON null.
void writeJsonValue(std::ostream& out, double v) {
    if (isDefined(v)) out << v;
    else out << "null";
}

void writeUtf8Bom(std::ostream& out) {
    out << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
}

} // namespace

Report::Report(const BarSeries& series, const PipelineResult& result, const std::string& params)
    : series_(series), result_(result), params_(params) {}

void Report::printReportHeader(std::ostream& out) const {
    out << "Symbol: " << (series_.symbol().empty() ? "-" : series_.symbol())
        << "  interval=" << series_.interval() << "  period=" << series_.period() << "\n";
    if (!params_.empty()) out << "Params: " << params_ << "\n";
}

void Report::printBody(std::ostream& out) const {
    const auto& s = result_.summary;
    out << std::fixed << std::setprecision(2);
    out << "Bars analyzed:  " << series_.size() << "\n";

    if (!series_.empty()) {
        const std::size_t last = series_.size() - 1;
        const auto& f = result_.frame;
        out << "Last bar:       " << series_.back().timestamp << "  close " << series_.back().close << "\n";
        out << "SMA short/long: ";
        if (isDefined(f.sma_short[last])) out << f.sma_short[last]; else out << "n/a";
        out << " / ";
        if (isDefined(f.sma_long[last])) out << f.sma_long[last]; else out << "n/a";
        out << "  (" << trendStateName(result_.states[last]) << ")\n";
        out << "RSI:            ";
        if (isDefined(f.rsi[last])) out << f.rsi[last]; else out << "n/a";
        out << "  (" << rsiZoneName(classifyRsi(f.rsi[last])) << ")\n";
        out << "Support/Resist: ";
        if (isDefined(f.support[last])) out << f.support[last]; else out << "n/a";
        out << " / ";
        if (isDefined(f.resistance[last])) out << f.resistance[last]; else out << "n/a";
        out << "\n";
    }

    int buys = 0;
    for (const auto& ev : result_.events)
        if (ev.kind == CrossKind::BuyCross) ++buys;
    out << "Crossovers:     " << result_.events.size()
        << " (" << buys << " buy, " << (result_.events.size() - static_cast<std::size_t>(buys)) << " sell)\n";

    if (!s.has_trades) {
        out << "Closed trades:  0 (no trades)\n";
    } else {
        out << "Closed trades:  " << s.trade_count << "\n";
        out << "Winning trades: " << s.winning_trades << "\n";
        out << "Win rate:       " << s.win_rate * 100.0 << "%\n";
        out << "Total return:   " << s.total_return_pct << "%\n";
        out << "Avg profit:     " << s.avg_profit_pct << "%\n";
    }
    if (result_.open_position) {
        const auto& p = *result_.open_position;
        out << "Open position:  long since " << p.entry_time << " @ " << p.entry_price << "\n";
        out << "Unrealized:     " << p.unrealized_pct << "% (not in totals)\n";
    }
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Trend Report ==========\n";
    printReportHeader(out);
    printBody(out);
    out << "==================================\n\n";
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    writeUtf8Bom(f);
    f << "entry_time,exit_time,entry_price,exit_price,profit_pct\n";
    f << std::fixed << std::setprecision(4);
    for (const auto& t : result_.trades) {
        writeCsvQuoted(f, t.entry_time);
        f << ',';
        writeCsvQuoted(f, t.exit_time);
        f << ',' << t.entry_price << ',' << t.exit_price << ',' << t.profit_pct << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeIndicators(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    writeUtf8Bom(f);
    f << "bar_index,timestamp,open,high,low,close,volume,sma_short,sma_long,rsi,vol_avg,resistance,support,trend\n";
    f << std::fixed << std::setprecision(4);
    const auto& fr = result_.frame;
    for (std::size_t i = 0; i < series_.size(); ++i) {
        const Bar& b = series_.at(i);
        f << i << ',';
        writeCsvQuoted(f, b.timestamp);
        f << ',' << b.open << ',' << b.high << ',' << b.low << ',' << b.close << ',' << b.volume << ',';
        writeCsvValue(f, fr.sma_short[i]); f << ',';
        writeCsvValue(f, fr.sma_long[i]); f << ',';
        writeCsvValue(f, fr.rsi[i]); f << ',';
        writeCsvValue(f, fr.vol_avg[i]); f << ',';
        writeCsvValue(f, fr.resistance[i]); f << ',';
        writeCsvValue(f, fr.support[i]); f << ',';
        f << trendStateName(result_.states[i]) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write indicators: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeSignals(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    writeUtf8Bom(f);
    f << "bar_index,timestamp,signal,price,sma_short,sma_long\n";
    f << std::fixed << std::setprecision(4);
    for (const auto& ev : result_.events) {
        f << ev.index << ',';
        writeCsvQuoted(f, ev.timestamp);
        f << ',' << crossKindName(ev.kind) << ',' << ev.price << ',' << ev.sma_short << ',' << ev.sma_long << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write signals: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Trend Report\n";
    f << "============\n\n";
    printReportHeader(f);
    f << "\n";
    printBody(f);
    f << "\nTrades\n------\n";
    f << std::fixed << std::setprecision(2);
    for (const auto& t : result_.trades) {
        f << t.entry_time << " @ " << t.entry_price << "  ->  "
          << t.exit_time << " @ " << t.exit_price << "  " << t.profit_pct << "%\n";
    }
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeSessionJson(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << std::fixed << std::setprecision(4);
    f << "{\n  \"symbol\": ";
    writeJsonString(f, series_.symbol());
    f << ",\n  \"interval\": ";
    writeJsonString(f, series_.interval());
    f << ",\n  \"period\": ";
    writeJsonString(f, series_.period());
    f << ",\n  \"params\": ";
    writeJsonString(f, params_);
    f << ",\n  \"bars\": [\n";
    const auto& fr = result_.frame;
    for (std::size_t i = 0; i < series_.size(); ++i) {
        const Bar& b = series_.at(i);
        f << "    {\"t\":";
        writeJsonString(f, b.timestamp);
        f << ",\"o\":" << b.open << ",\"h\":" << b.high << ",\"l\":" << b.low << ",\"c\":" << b.close
          << ",\"v\":" << b.volume << ",\"up\":" << (b.isUp() ? "true" : "false");
        f << ",\"sma_short\":"; writeJsonValue(f, fr.sma_short[i]);
        f << ",\"sma_long\":"; writeJsonValue(f, fr.sma_long[i]);
        f << ",\"rsi\":"; writeJsonValue(f, fr.rsi[i]);
        f << ",\"vol_avg\":"; writeJsonValue(f, fr.vol_avg[i]);
        f << ",\"resistance\":"; writeJsonValue(f, fr.resistance[i]);
        f << ",\"support\":"; writeJsonValue(f, fr.support[i]);
        f << "}";
        if (i + 1 < series_.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n  \"signals\": [\n";
    const auto& events = result_.events;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& ev = events[i];
        f << "    {\"index\":" << ev.index << ",\"t\":";
        writeJsonString(f, ev.timestamp);
        f << ",\"signal\":\"" << crossKindName(ev.kind) << "\",\"price\":" << ev.price
          << ",\"sma_short\":" << ev.sma_short << "}";
        if (i + 1 < events.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n  \"trades\": [\n";
    const auto& trades = result_.trades;
    for (std::size_t i = 0; i < trades.size(); ++i) {
        const auto& t = trades[i];
        f << "    {\"entry_time\":";
        writeJsonString(f, t.entry_time);
        f << ",\"exit_time\":";
        writeJsonString(f, t.exit_time);
        f << ",\"entry_price\":" << t.entry_price << ",\"exit_price\":" << t.exit_price
          << ",\"profit_pct\":" << t.profit_pct << "}";
        if (i + 1 < trades.size()) f << ",";
        f << "\n";
    }
    f << "  ],\n  \"open_position\": ";
    if (result_.open_position) {
        const auto& p = *result_.open_position;
        f << "{\"entry_time\":";
        writeJsonString(f, p.entry_time);
        f << ",\"entry_price\":" << p.entry_price << ",\"last_price\":" << p.last_price
          << ",\"unrealized_pct\":" << p.unrealized_pct << "}";
    } else {
        f << "null";
    }
    const auto& s = result_.summary;
    f << ",\n  \"summary\": {\"trade_count\":" << s.trade_count
      << ",\"winning_trades\":" << s.winning_trades
      << ",\"win_rate\":" << s.win_rate
      << ",\"total_return_pct\":" << s.total_return_pct
      << ",\"avg_profit_pct\":" << s.avg_profit_pct << "}\n}\n";
    if (!f) {
        std::cerr << "Failed to write session JSON: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace trend
