#include "config.hpp"
#include <cctype>

namespace trend {

namespace {

std::string lowered(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool requirePositive(int value, const char* name, std::string& error_msg) {
    if (value >= 1) return true;
    error_msg = std::string(name) + " must be >= 1 (got " + std::to_string(value) + ")";
    return false;
}

} // namespace

bool validateConfig(const EngineConfig& cfg, std::string& error_msg) {
    if (!requirePositive(cfg.w_short, "w_short", error_msg)) return false;
    if (!requirePositive(cfg.w_long, "w_long", error_msg)) return false;
    if (!requirePositive(cfg.w_momentum, "w_momentum", error_msg)) return false;
    if (!requirePositive(cfg.w_extrema, "w_extrema", error_msg)) return false;
    if (!requirePositive(cfg.w_volume, "w_volume", error_msg)) return false;
    if (cfg.w_short >= cfg.w_long) {
        error_msg = "w_short (" + std::to_string(cfg.w_short) + ") must be less than w_long ("
            + std::to_string(cfg.w_long) + ")";
        return false;
    }
    return true;
}

bool parseRsiPolicy(const std::string& name, RsiPolicy& out) {
    std::string n = lowered(name);
    if (n == "simple" || n == "sma") { out = RsiPolicy::Simple; return true; }
    if (n == "wilder" || n == "ewm") { out = RsiPolicy::Wilder; return true; }
    return false;
}

bool parseWarmupPolicy(const std::string& name, WarmupPolicy& out) {
    std::string n = lowered(name);
    if (n == "buy") { out = WarmupPolicy::BuyIfBullish; return true; }
    if (n == "silent") { out = WarmupPolicy::Silent; return true; }
    return false;
}

const char* rsiPolicyName(RsiPolicy policy) {
    return policy == RsiPolicy::Wilder ? "wilder" : "simple";
}

const char* warmupPolicyName(WarmupPolicy policy) {
    return policy == WarmupPolicy::Silent ? "silent" : "buy";
}

std::string describeConfig(const EngineConfig& cfg) {
    return "short=" + std::to_string(cfg.w_short)
        + " long=" + std::to_string(cfg.w_long)
        + " rsi=" + std::to_string(cfg.w_momentum) + "/" + rsiPolicyName(cfg.rsi_policy)
        + " extrema=" + std::to_string(cfg.w_extrema)
        + " volume=" + std::to_string(cfg.w_volume)
        + " warmup=" + warmupPolicyName(cfg.warmup);
}

} // namespace trend
