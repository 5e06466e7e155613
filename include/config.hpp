#pragma once

#include <string>

namespace trend {

/// How RSI averages gains and losses.
enum class RsiPolicy { Simple, Wilder };

/// What the signal detector does with the first bar where both SMAs are defined.
/// The first defined bar never emits an event; it seeds the trend state.
/// BuyIfBullish: the seed is not-bullish, so a bullish bar right after warm-up emits a BuyCross.
/// Silent: the seed is the first defined bar's own state.
enum class WarmupPolicy { BuyIfBullish, Silent };

/// Engine parameters. Defaults: SMA 18/50, RSI 14, support/resistance 20, volume average 20.
struct EngineConfig {
    int w_short{18};
    int w_long{50};
    int w_momentum{14};
    int w_extrema{20};
    int w_volume{20};
    RsiPolicy rsi_policy{RsiPolicy::Simple};
    WarmupPolicy warmup{WarmupPolicy::BuyIfBullish};
};

/// Returns false and sets error_msg (naming the offending parameter) if config is invalid.
bool validateConfig(const EngineConfig& cfg, std::string& error_msg);

/// Parse "simple" / "wilder" (case-insensitive). Returns false on unknown name.
bool parseRsiPolicy(const std::string& name, RsiPolicy& out);
/// Parse "buy" / "silent" (case-insensitive). Returns false on unknown name.
bool parseWarmupPolicy(const std::string& name, WarmupPolicy& out);

const char* rsiPolicyName(RsiPolicy policy);
const char* warmupPolicyName(WarmupPolicy policy);

/// One-line parameter string for report headers, e.g. "short=18 long=50 rsi=14/simple ...".
std::string describeConfig(const EngineConfig& cfg);

} // namespace trend
