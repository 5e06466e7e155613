#include "momentum.hpp"
#include "simple_rsi.hpp"
#include "wilder_rsi.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace trend {

void splitGainsLosses(const std::vector<double>& closes,
                      std::vector<double>& gains,
                      std::vector<double>& losses) {
    gains.assign(closes.size(), 0.0);
    losses.assign(closes.size(), 0.0);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        double delta = closes[i] - closes[i - 1];
        gains[i] = std::max(delta, 0.0);
        losses[i] = std::max(-delta, 0.0);
    }
}

double rsiFromAverages(double avg_gain, double avg_loss) {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    if (std::isnan(avg_gain) || std::isnan(avg_loss)) return NaN;
    if (avg_loss == 0.0) return avg_gain == 0.0 ? NaN : 100.0;
    return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
}

std::unique_ptr<IRsiPolicy> createRsiPolicy(RsiPolicy policy) {
    if (policy == RsiPolicy::Wilder) return createWilderRsi();
    return createSimpleRsi();
}

} // namespace trend
