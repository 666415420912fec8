#include "delay_policy.hpp"
#include "errors.hpp"
#include "sink.hpp"
#include "util.hpp"
#include <algorithm>

namespace chatpace {

const char* delay_strategy_name(DelayStrategy strategy) {
    switch (strategy) {
        case DelayStrategy::None: return "none";
        case DelayStrategy::Constant: return "constant";
        case DelayStrategy::Random: return "random";
        case DelayStrategy::Proportional: return "proportional";
    }
    return "none";
}

DelayStrategy parse_delay_strategy(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "none") return DelayStrategy::None;
    if (n == "constant" || n == "simple") return DelayStrategy::Constant;
    if (n == "random") return DelayStrategy::Random;
    if (n == "proportional") return DelayStrategy::Proportional;
    throw ConfigError("Unknown delay strategy: " + name);
}

void validate(const DelaySpec& spec) {
    if (spec.min_ms > spec.max_ms) {
        throw ConfigError("delay min_ms (" + std::to_string(spec.min_ms) +
                          ") exceeds max_ms (" + std::to_string(spec.max_ms) + ")");
    }
}

static uint64_t resolve_seed(uint64_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

DelayPolicy::DelayPolicy(const DelaySpec& spec)
    : DelayPolicy(spec, spec.seed)
{}

DelayPolicy::DelayPolicy(const DelaySpec& spec, uint64_t seed)
    : spec_(spec), engine_(resolve_seed(seed)) {
    validate(spec_);
}

std::chrono::milliseconds DelayPolicy::next_delay(const MessageChunk& chunk) {
    uint64_t ms = 0;
    switch (spec_.strategy) {
        case DelayStrategy::None:
            break;
        case DelayStrategy::Constant:
            ms = spec_.min_ms;
            break;
        case DelayStrategy::Random: {
            std::uniform_int_distribution<uint32_t> dist(spec_.min_ms, spec_.max_ms);
            ms = dist(engine_);
            break;
        }
        case DelayStrategy::Proportional: {
            uint64_t raw = static_cast<uint64_t>(utf8_length(chunk.text)) * spec_.ms_per_char;
            ms = std::clamp<uint64_t>(raw, spec_.min_ms, spec_.max_ms);
            break;
        }
    }
    if (chunk.index == 0) ms += spec_.initial_ms;
    return std::chrono::milliseconds(ms);
}

} // namespace chatpace
