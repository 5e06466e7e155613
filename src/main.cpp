#include "backtester.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "report.hpp"
#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace {

constexpr const char* DEFAULT_DATA_PATH = "data/sample_ohlc.csv";

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = DEFAULT_DATA_PATH;
    std::string symbol;               // defaults to the data file stem
    std::string interval = "1d";
    std::string period = "max";
    std::string reports_dir = "reports";
    bool write_reports = true;

    trend::EngineConfig engine;
};

bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: trend_engine [--data FILE] [--symbol NAME] [--interval 1m|5m|15m|30m|1h|1d|1wk]\n"
           "                    [--period 1d|5d|1mo|3mo|6mo|1y|2y|5y|max]\n"
           "                    [--short N] [--long N] [--rsi-period N] [--extrema N] [--volume-window N]\n"
           "                    [--rsi-policy simple|wilder] [--warmup buy|silent]\n"
           "                    [--reports-dir DIR] [--no-reports]\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--data") { if (!next()) return missing(); cfg.data_path = argv[i]; }
        else if (arg == "--symbol") { if (!next()) return missing(); cfg.symbol = argv[i]; }
        else if (arg == "--interval") { if (!next()) return missing(); cfg.interval = argv[i]; }
        else if (arg == "--period") { if (!next()) return missing(); cfg.period = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return missing(); cfg.reports_dir = argv[i]; }
        else if (arg == "--no-reports") { cfg.write_reports = false; }
        else if (arg == "--short") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.engine.w_short, error_msg, "--short")) return false; }
        else if (arg == "--long") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.engine.w_long, error_msg, "--long")) return false; }
        else if (arg == "--rsi-period") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.engine.w_momentum, error_msg, "--rsi-period")) return false; }
        else if (arg == "--extrema") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.engine.w_extrema, error_msg, "--extrema")) return false; }
        else if (arg == "--volume-window") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.engine.w_volume, error_msg, "--volume-window")) return false; }
        else if (arg == "--rsi-policy") {
            if (!next()) return missing();
            if (!trend::parseRsiPolicy(argv[i], cfg.engine.rsi_policy)) {
                error_msg = std::string("Invalid value for --rsi-policy: \"") + argv[i] + "\" (expected simple or wilder)";
                return false;
            }
        }
        else if (arg == "--warmup") {
            if (!next()) return missing();
            if (!trend::parseWarmupPolicy(argv[i], cfg.engine.warmup)) {
                error_msg = std::string("Invalid value for --warmup: \"") + argv[i] + "\" (expected buy or silent)";
                return false;
            }
        }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (!trend::DataSource::isKnownInterval(cfg.interval)) { error_msg = "--interval must be one of 1m, 5m, 15m, 30m, 1h, 1d, 1wk"; return false; }
    if (!trend::DataSource::isKnownPeriod(cfg.period)) { error_msg = "--period must be one of 1d, 5d, 1mo, 3mo, 6mo, 1y, 2y, 5y, max"; return false; }
    return trend::validateConfig(cfg.engine, error_msg);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

int writeReports(const Config& cfg, const trend::Report& report) {
    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create reports directory " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    const fs::path dir(cfg.reports_dir);
    bool ok = report.writeTradeLog((dir / "trades.csv").string());
    ok = report.writeIndicators((dir / "indicators.csv").string()) && ok;
    ok = report.writeSignals((dir / "signals.csv").string()) && ok;
    ok = report.writeReport((dir / "report.txt").string()) && ok;
    ok = report.writeSessionJson((dir / "session.json").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    if (!parseArgs(argc, argv, cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data path when running from build/
    const std::string fallback = std::string("../") + DEFAULT_DATA_PATH;
    if (cfg.data_path == DEFAULT_DATA_PATH && !fs::is_regular_file(cfg.data_path) && fs::is_regular_file(fallback))
        cfg.data_path = fallback;

    if (cfg.symbol.empty())
        cfg.symbol = upper(fs::path(cfg.data_path).stem().string());

    trend::Backtester bt(cfg.engine, cfg.data_path, cfg.symbol, cfg.interval, cfg.period);
    if (!bt.run()) {
        std::cerr << "No data: " << bt.errorMessage() << "\n";
        std::cerr << "Intraday intervals usually cover short periods only; try a shorter --period or a coarser --interval.\n";
        return 1;
    }
    if (bt.skippedRows() > 0)
        std::cerr << "Skipped " << bt.skippedRows() << " malformed or duplicate rows in " << cfg.data_path << "\n";

    trend::Report report(bt.series(), bt.result(), trend::describeConfig(cfg.engine));
    report.printSummary(std::cout);

    if (!cfg.write_reports) return 0;
    return writeReports(cfg, report);
}
