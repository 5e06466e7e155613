#include "simple_rsi.hpp"
#include "indicators.hpp"
#include <vector>
#include <memory>
#include <limits>

namespace trend {

/// RSI from the arithmetic mean of the last `period` gains and losses.
class SimpleRsi : public IRsiPolicy {
public:
    std::vector<double> compute(const std::vector<double>& closes, int period) const override {
        std::vector<double> gains, losses;
        splitGainsLosses(closes, gains, losses);
        const std::vector<double> avg_gain = rollingMean(gains, period);
        const std::vector<double> avg_loss = rollingMean(losses, period);

        std::vector<double> out(closes.size(), std::numeric_limits<double>::quiet_NaN());
        for (std::size_t i = 0; i < closes.size(); ++i)
            out[i] = rsiFromAverages(avg_gain[i], avg_loss[i]);
        return out;
    }

    const char* name() const override { return "simple"; }
};

std::unique_ptr<IRsiPolicy> createSimpleRsi() {
    return std::make_unique<SimpleRsi>();
}

} // namespace trend
