#include "typing.hpp"
#include "sink.hpp"
#include <iostream>
#include <thread>

namespace chatpace {

SleepFn real_sleep() {
    return [](std::chrono::milliseconds ms) {
        if (ms.count() > 0) std::this_thread::sleep_for(ms);
    };
}

TypingIndicatorController::TypingIndicatorController(Sink& sink, TypingConfig config,
                                                     SleepFn sleep)
    : sink_(sink), config_(config), sleep_(std::move(sleep))
{}

void TypingIndicatorController::show(const std::string& chat_id) {
    set(chat_id, true);
}

void TypingIndicatorController::hide(const std::string& chat_id) {
    set(chat_id, false);
}

void TypingIndicatorController::idle() {
    if (config_.idle_ms > 0) sleep_(std::chrono::milliseconds(config_.idle_ms));
}

void TypingIndicatorController::set(const std::string& chat_id, bool typing) {
    if (!config_.enabled) return;
    try {
        sink_.set_typing(chat_id, typing);
    } catch (const std::exception& e) {
        std::cerr << "[typing] " << sink_.sink_name() << " failed to "
                  << (typing ? "show" : "hide") << " indicator for " << chat_id
                  << ": " << e.what() << '\n';
    }
}

} // namespace chatpace
