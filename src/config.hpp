#pragma once
#include "delay_policy.hpp"
#include "mode_selector.hpp"
#include "scheduler.hpp"
#include "splitter.hpp"
#include "typing.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace chatpace {

struct Config {
    SplitConfig split;
    DelaySpec delay;
    TypingConfig typing;
    SchedulerConfig dispatch;
    ReplyMode reply_mode = ReplyMode::Auto;

    // Load from ~/.chatpace/config.json + env vars. Missing keys are filled
    // from defaults and written back.
    static Config load();
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (merged) config document. Throws ConfigError on unknown
    // mode names; validate() is not applied.
    static Config from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    // Apply CHATPACE_* environment overrides
    void apply_env();

    // Throws ConfigError for inconsistent thresholds
    void validate() const;
};

} // namespace chatpace
