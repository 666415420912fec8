#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chatpace {

nlohmann::json Config::defaults_json() {
    return {
        {"split", {
            {"mode", "simple_improved"},
            {"max_chunk_length", 400},
            {"min_chunk_length", 80}
        }},
        {"delay", {
            {"strategy", "proportional"},
            {"min_ms", 800},
            {"max_ms", 6000},
            {"ms_per_char", 40},
            {"initial_ms", 0},
            {"seed", 0}
        }},
        {"typing", {
            {"enabled", true},
            {"idle_ms", 500}
        }},
        {"dispatch", {
            {"retry_count", 3},
            {"retry_backoff_ms", 250},
            {"timeout_ms", 10000}
        }},
        {"reply_mode", "auto"}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integers only; anything else keeps the default
static bool is_count(const nlohmann::json& obj, const char* key) {
    return obj.contains(key) && obj[key].is_number_integer() &&
           (obj[key].is_number_unsigned() || obj[key].get<int64_t>() >= 0);
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!is_count(obj, key)) return;
    uint64_t value = obj[key].get<uint64_t>();
    if (value > UINT32_MAX) {
        throw ConfigError(std::string(key) + " out of range: " + std::to_string(value));
    }
    out = static_cast<uint32_t>(value);
}

static void read_size(const nlohmann::json& obj, const char* key, size_t& out) {
    if (is_count(obj, key)) out = obj[key].get<size_t>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("split") && j["split"].is_object()) {
        auto& s = j["split"];
        if (s.contains("mode") && s["mode"].is_string())
            cfg.split.mode = parse_split_mode(s["mode"].get<std::string>());
        read_size(s, "max_chunk_length", cfg.split.max_chunk_length);
        read_size(s, "min_chunk_length", cfg.split.min_chunk_length);
    }

    if (j.contains("delay") && j["delay"].is_object()) {
        auto& d = j["delay"];
        if (d.contains("strategy") && d["strategy"].is_string())
            cfg.delay.strategy = parse_delay_strategy(d["strategy"].get<std::string>());
        read_u32(d, "min_ms", cfg.delay.min_ms);
        read_u32(d, "max_ms", cfg.delay.max_ms);
        read_u32(d, "ms_per_char", cfg.delay.ms_per_char);
        read_u32(d, "initial_ms", cfg.delay.initial_ms);
        if (is_count(d, "seed")) cfg.delay.seed = d["seed"].get<uint64_t>();
    }

    if (j.contains("typing") && j["typing"].is_object()) {
        auto& t = j["typing"];
        if (t.contains("enabled") && t["enabled"].is_boolean())
            cfg.typing.enabled = t["enabled"].get<bool>();
        read_u32(t, "idle_ms", cfg.typing.idle_ms);
    }

    if (j.contains("dispatch") && j["dispatch"].is_object()) {
        auto& d = j["dispatch"];
        read_u32(d, "retry_count", cfg.dispatch.retry_count);
        read_u32(d, "retry_backoff_ms", cfg.dispatch.retry_backoff_ms);
        read_u32(d, "timeout_ms", cfg.dispatch.dispatch_timeout_ms);
    }

    if (j.contains("reply_mode") && j["reply_mode"].is_string())
        cfg.reply_mode = parse_reply_mode(j["reply_mode"].get<std::string>());

    return cfg;
}

nlohmann::json Config::to_json() const {
    return {
        {"split", {
            {"mode", split_mode_name(split.mode)},
            {"max_chunk_length", split.max_chunk_length},
            {"min_chunk_length", split.min_chunk_length}
        }},
        {"delay", {
            {"strategy", delay_strategy_name(delay.strategy)},
            {"min_ms", delay.min_ms},
            {"max_ms", delay.max_ms},
            {"ms_per_char", delay.ms_per_char},
            {"initial_ms", delay.initial_ms},
            {"seed", delay.seed}
        }},
        {"typing", {
            {"enabled", typing.enabled},
            {"idle_ms", typing.idle_ms}
        }},
        {"dispatch", {
            {"retry_count", dispatch.retry_count},
            {"retry_backoff_ms", dispatch.retry_backoff_ms},
            {"timeout_ms", dispatch.dispatch_timeout_ms}
        }},
        {"reply_mode", reply_mode_name(reply_mode)}
    };
}

static size_t parse_length(const char* name, const char* value) {
    char* end = nullptr;
    unsigned long long n = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0') {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
    return static_cast<size_t>(n);
}

void Config::apply_env() {
    if (const char* v = std::getenv("CHATPACE_SPLIT_MODE"))
        split.mode = parse_split_mode(v);
    if (const char* v = std::getenv("CHATPACE_MAX_CHUNK"))
        split.max_chunk_length = parse_length("CHATPACE_MAX_CHUNK", v);
    if (const char* v = std::getenv("CHATPACE_MIN_CHUNK"))
        split.min_chunk_length = parse_length("CHATPACE_MIN_CHUNK", v);
    if (const char* v = std::getenv("CHATPACE_DELAY_STRATEGY"))
        delay.strategy = parse_delay_strategy(v);
    if (const char* v = std::getenv("CHATPACE_REPLY_MODE"))
        reply_mode = parse_reply_mode(v);
}

void Config::validate() const {
    chatpace::validate(split);
    chatpace::validate(delay);
}

Config Config::load() {
    return load_from(expand_home("~/.chatpace/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        nlohmann::json original;
        try {
            original = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            original = defaults_json();
        }
        file.close();
        j = merge_defaults(original, defaults_json());
        if (j != original) {
            if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

} // namespace chatpace
