#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace chatpace {

struct MessageChunk;

enum class DelayStrategy { None, Constant, Random, Proportional };

const char* delay_strategy_name(DelayStrategy strategy);

// "none", "constant" (alias "simple"), "random", "proportional".
// Throws ConfigError for anything else.
DelayStrategy parse_delay_strategy(const std::string& name);

struct DelaySpec {
    DelayStrategy strategy = DelayStrategy::Proportional;
    uint32_t min_ms = 800;
    uint32_t max_ms = 6000;
    uint32_t ms_per_char = 40;   // Proportional only
    uint32_t initial_ms = 0;     // extra wait before the first chunk
    uint64_t seed = 0;           // 0 = seed from std::random_device
};

// Throws ConfigError if min_ms > max_ms.
void validate(const DelaySpec& spec);

// Computes the wait before each chunk. Not thread-safe: every session
// owns its own instance, and with it its own engine.
class DelayPolicy {
public:
    explicit DelayPolicy(const DelaySpec& spec);
    DelayPolicy(const DelaySpec& spec, uint64_t seed);

    std::chrono::milliseconds next_delay(const MessageChunk& chunk);

    const DelaySpec& spec() const { return spec_; }

private:
    DelaySpec spec_;
    std::mt19937_64 engine_;
};

} // namespace chatpace
