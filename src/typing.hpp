#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace chatpace {

class Sink;

// Blocking wait; injectable so tests can record waits instead of sleeping.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Default SleepFn: std::this_thread::sleep_for
SleepFn real_sleep();

struct TypingConfig {
    bool enabled = true;
    uint32_t idle_ms = 500;   // pause with the indicator hidden before it shows
};

// Brackets each chunk with the sink's typing indicator. Holds no state
// besides its configuration; indicator failures are logged, never raised.
class TypingIndicatorController {
public:
    TypingIndicatorController(Sink& sink, TypingConfig config, SleepFn sleep);

    void show(const std::string& chat_id);
    void hide(const std::string& chat_id);

    // Wait the idle interval (indicator hidden)
    void idle();

    const TypingConfig& config() const { return config_; }

private:
    void set(const std::string& chat_id, bool typing);

    Sink& sink_;
    TypingConfig config_;
    SleepFn sleep_;
};

} // namespace chatpace
