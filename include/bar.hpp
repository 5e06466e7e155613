#pragma once

#include <string>
#include <cstdint>

namespace trend {

/// Single OHLCV (Open, High, Low, Close, Volume) bar.
struct Bar {
    std::string timestamp;  // e.g. "2024-01-02" or ISO datetime; lexicographic order == time order
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    std::uint64_t volume{0};

    bool isUp() const { return close >= open; }
};

} // namespace trend
