#pragma once

#include "momentum.hpp"
#include <memory>

namespace trend {

/// Factory: RSI with gains and losses averaged by a simple rolling mean.
std::unique_ptr<IRsiPolicy> createSimpleRsi();

} // namespace trend
