#include "data_source.hpp"
#include "bar_series.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <map>
#include <stdexcept>

namespace trend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

// Parse timestamp to (year, month, day, hour, minute). Returns false if unparseable.
// Supports: "2024-01-02", "2024-01-02T09:30:00", "2024-01-02 09:30:00", "2025-08-04T00_00_00.000Z"
bool parseTimestamp(const std::string& ts, int& year, int& month, int& day, int& hour, int& minute) {
    year = month = day = hour = minute = 0;
    std::string s = ts;
    for (auto& c : s) if (c == '_') c = ':';
    std::string datePart, timePart;
    auto tPos = s.find('T');
    auto spPos = s.find(' ');
    if (tPos != std::string::npos) {
        datePart = s.substr(0, tPos);
        timePart = s.substr(tPos + 1);
    } else if (spPos != std::string::npos) {
        datePart = s.substr(0, spPos);
        timePart = s.substr(spPos + 1);
    } else {
        datePart = s;
    }
    // Date YYYY-MM-DD
    if (datePart.size() < 10) return false;
    try {
        year = std::stoi(datePart.substr(0, 4));
        month = std::stoi(datePart.substr(5, 2));
        day = std::stoi(datePart.substr(8, 2));
    } catch (const std::exception&) { return false; }
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;
    if (!timePart.empty()) {
        auto colon1 = timePart.find(':');
        if (colon1 != std::string::npos) {
            try {
                hour = std::stoi(timePart.substr(0, colon1));
                minute = std::stoi(timePart.substr(colon1 + 1, 2));
            } catch (const std::exception&) {
                hour = minute = 0;
            }
        }
    }
    return true;
}

// Days since 1970-01-01 (proleptic Gregorian).
long daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(long z, int& y, int& m, int& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2));
}

// Volumes must round into a signed 64-bit integer (2^63).
constexpr double MAX_VOLUME = 9223372036854775808.0;

constexpr int MINUTES_PER_DAY = 1440;
constexpr int MINUTES_PER_WEEK = 7 * MINUTES_PER_DAY;

// Interval tag -> bucket length in minutes; 0 if unknown.
int intervalMinutes(std::string interval) {
    toLower(interval);
    if (interval == "1m") return 1;
    if (interval == "5m") return 5;
    if (interval == "15m") return 15;
    if (interval == "30m") return 30;
    if (interval == "1h" || interval == "1hr" || interval == "60m") return 60;
    if (interval == "1d") return MINUTES_PER_DAY;
    if (interval == "1wk") return MINUTES_PER_WEEK;
    return 0;
}

// Period tag -> lookback in calendar days; 0 means unbounded ("max"), -1 unknown.
long periodDays(std::string period) {
    toLower(period);
    if (period == "max" || period.empty()) return 0;
    if (period == "1d") return 1;
    if (period == "5d") return 5;
    if (period == "1mo") return 30;
    if (period == "3mo") return 91;
    if (period == "6mo") return 182;
    if (period == "1y") return 365;
    if (period == "2y") return 730;
    if (period == "5y") return 1826;
    return -1;
}

std::string dateKey(int year, int month, int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

// Bucket key: "YYYY-MM-DDTHH:MM" for intraday buckets, "YYYY-MM-DD" for daily,
// the Monday of the week for weekly.
std::string bucketKey(int year, int month, int day, int hour, int minute, int bucketMinutes) {
    if (bucketMinutes >= MINUTES_PER_WEEK) {
        long days = daysFromCivil(year, month, day);
        long weekday = ((days + 3) % 7 + 7) % 7;  // 0 = Monday (1970-01-01 was a Thursday)
        int y, m, d;
        civilFromDays(days - weekday, y, m, d);
        return dateKey(y, m, d);
    }
    if (bucketMinutes >= MINUTES_PER_DAY) return dateKey(year, month, day);
    int m = (bucketMinutes >= 60) ? 0 : (minute / bucketMinutes) * bucketMinutes;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d", year, month, day, hour, m);
    return std::string(buf);
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::isKnownInterval(const std::string& interval) {
    return intervalMinutes(interval) > 0;
}

bool DataSource::isKnownPeriod(const std::string& period) {
    return periodDays(period) >= 0;
}

bool DataSource::load() {
    bars_.clear();
    skipped_rows_ = 0;
    std::ifstream f(filepath_);
    if (!f.is_open()) return false;

    std::string line;
    if (!std::getline(f, line)) return false;
    // Strip UTF-8 BOM written by spreadsheet exports.
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c", "adj close"});

    if (iDate < 0 || iOpen < 0 || iHigh < 0 || iLow < 0 || iClose < 0)
        return false;

    while (std::getline(f, line)) {
        if (trim(line).empty()) continue;
        auto bar = parseLine(line, headers);
        if (!bar) {
            ++skipped_rows_;
            continue;
        }
        bars_.push_back(*bar);
    }

    normalize();
    return true;
}

void DataSource::normalize() {
    std::stable_sort(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });
    // Duplicate timestamps: the last row in file order wins.
    std::vector<Bar> unique;
    unique.reserve(bars_.size());
    for (const Bar& b : bars_) {
        if (!unique.empty() && unique.back().timestamp == b.timestamp) {
            unique.back() = b;
            ++skipped_rows_;
        } else {
            unique.push_back(b);
        }
    }
    bars_ = std::move(unique);
}

bool DataSource::aggregateBars(const std::string& interval) {
    const int bucket = intervalMinutes(interval);
    if (bucket == 0) return false;
    if (bucket == 1) return true;

    std::map<std::string, Bar> keyToBar;
    for (const Bar& b : bars_) {
        int y, mo, d, h, mi;
        if (!parseTimestamp(b.timestamp, y, mo, d, h, mi)) continue;
        std::string key = bucketKey(y, mo, d, h, mi, bucket);
        auto it = keyToBar.find(key);
        if (it == keyToBar.end()) {
            Bar agg = b;
            agg.timestamp = key;
            keyToBar[key] = agg;
        } else {
            Bar& agg = it->second;
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    bars_.clear();
    for (const auto& p : keyToBar)
        bars_.push_back(p.second);
    return true;
}

bool DataSource::trimToPeriod(const std::string& period) {
    const long span = periodDays(period);
    if (span < 0) return false;
    if (span == 0 || bars_.empty()) return true;

    int y, mo, d, h, mi;
    if (!parseTimestamp(bars_.back().timestamp, y, mo, d, h, mi)) return false;
    const long cutoff = daysFromCivil(y, mo, d) - span;

    std::vector<Bar> kept;
    for (const Bar& b : bars_) {
        if (!parseTimestamp(b.timestamp, y, mo, d, h, mi)) continue;
        if (daysFromCivil(y, mo, d) > cutoff) kept.push_back(b);
    }
    bars_ = std::move(kept);
    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line,
                                         const std::vector<std::string>& headers) const {
    auto parts = split(line, ',');
    if (parts.size() < 5) return std::nullopt;

    int iDate = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    int iOpen = findColumn(headers, {"open", "o"});
    int iHigh = findColumn(headers, {"high", "h"});
    int iLow = findColumn(headers, {"low", "l"});
    int iClose = findColumn(headers, {"close", "c", "adj close"});
    int iVol = findColumn(headers, {"volume", "vol", "v"});

    const int required[] = { iDate, iOpen, iHigh, iLow, iClose };
    for (int idx : required)
        if (static_cast<std::size_t>(idx) >= parts.size()) return std::nullopt;

    Bar b;
    b.timestamp = parts[static_cast<std::size_t>(iDate)];
    if (b.timestamp.empty()) return std::nullopt;
    try {
        b.open = std::stod(parts[static_cast<std::size_t>(iOpen)]);
        b.high = std::stod(parts[static_cast<std::size_t>(iHigh)]);
        b.low = std::stod(parts[static_cast<std::size_t>(iLow)]);
        b.close = std::stod(parts[static_cast<std::size_t>(iClose)]);
        if (iVol >= 0 && static_cast<std::size_t>(iVol) < parts.size()
            && !parts[static_cast<std::size_t>(iVol)].empty()) {
            double v = std::stod(parts[static_cast<std::size_t>(iVol)]);
            if (!std::isfinite(v) || v < 0 || v >= MAX_VOLUME) return std::nullopt;
            b.volume = static_cast<std::uint64_t>(std::llround(v));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    // Aggregation and period trimming need a calendar timestamp.
    int y, mo, d, h, mi;
    if (!parseTimestamp(b.timestamp, y, mo, d, h, mi)) return std::nullopt;

    std::string reason;
    if (!BarSeries::validateBar(b, reason)) return std::nullopt;
    return b;
}

} // namespace trend
