#pragma once

#include "momentum.hpp"
#include <memory>

namespace trend {

/// Factory: RSI with Wilder smoothing (alpha = 1/period, i.e. center of mass period-1).
std::unique_ptr<IRsiPolicy> createWilderRsi();

} // namespace trend
