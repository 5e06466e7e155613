#pragma once

#include "config.hpp"
#include <vector>
#include <memory>

namespace trend {

/// Averaging policy for the RSI oscillator.
/// Policies share the gain/loss split and the final formula; they differ only in how
/// gains and losses are averaged, so their outputs diverge on the same input.
class IRsiPolicy {
public:
    virtual ~IRsiPolicy() = default;

    /// RSI per close (same length as closes). Leading period-1 entries are NaN.
    virtual std::vector<double> compute(const std::vector<double>& closes, int period) const = 0;

    virtual const char* name() const = 0;
};

/// gains[i] = max(close[i] - close[i-1], 0), losses[i] = max(close[i-1] - close[i], 0).
/// Bar 0 has no predecessor and contributes zero to both.
void splitGainsLosses(const std::vector<double>& closes,
                      std::vector<double>& gains,
                      std::vector<double>& losses);

/// 100 - 100 / (1 + avg_gain / avg_loss).
/// Flat run (both averages zero) is NaN; zero loss with positive gain is 100.
double rsiFromAverages(double avg_gain, double avg_loss);

std::unique_ptr<IRsiPolicy> createRsiPolicy(RsiPolicy policy);

} // namespace trend
