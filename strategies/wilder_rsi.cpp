#include "wilder_rsi.hpp"
#include <vector>
#include <memory>
#include <limits>

namespace trend {

/// Wilder RSI. The averages are seeded with the simple mean of the first `period`
/// gains/losses, then smoothed: avg = avg * (1 - alpha) + x * alpha, alpha = 1 / period.
class WilderRsi : public IRsiPolicy {
public:
    std::vector<double> compute(const std::vector<double>& closes, int period) const override {
        std::vector<double> out(closes.size(), std::numeric_limits<double>::quiet_NaN());
        if (period <= 0 || closes.size() < static_cast<std::size_t>(period)) return out;

        std::vector<double> gains, losses;
        splitGainsLosses(closes, gains, losses);

        const std::size_t p = static_cast<std::size_t>(period);
        double avg_gain = 0;
        double avg_loss = 0;
        for (std::size_t i = 0; i < p; ++i) {
            avg_gain += gains[i];
            avg_loss += losses[i];
        }
        avg_gain /= period;
        avg_loss /= period;
        out[p - 1] = rsiFromAverages(avg_gain, avg_loss);

        const double alpha = 1.0 / period;
        for (std::size_t i = p; i < closes.size(); ++i) {
            avg_gain = avg_gain * (1.0 - alpha) + gains[i] * alpha;
            avg_loss = avg_loss * (1.0 - alpha) + losses[i] * alpha;
            out[i] = rsiFromAverages(avg_gain, avg_loss);
        }
        return out;
    }

    const char* name() const override { return "wilder"; }
};

std::unique_ptr<IRsiPolicy> createWilderRsi() {
    return std::make_unique<WilderRsi>();
}

} // namespace trend
