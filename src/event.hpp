#pragma once
#include "mode_selector.hpp"
#include "plan.hpp"
#include "session.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace chatpace {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// New user activity in a chat, as delivered by the platform adapter.
// Events of one chat must be published in arrival order.
struct InterruptEvent {
    std::string chat_id;
    uint64_t arrival_time = 0;                    // epoch ms
    std::string raw_text;
    std::string message_id;
    std::optional<std::string> reply_to_message_id;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* InterruptReceived = "InterruptReceived";
    constexpr const char* SessionStarted    = "SessionStarted";
    constexpr const char* ChunkDelivered    = "ChunkDelivered";
    constexpr const char* SessionFinished   = "SessionFinished";
    constexpr const char* TurnDeferred      = "TurnDeferred";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct InterruptReceivedEvent : Event {
    static constexpr const char* TAG = event_tags::InterruptReceived;
    InterruptEvent interrupt;

    InterruptReceivedEvent() { type_tag = TAG; }
};

struct SessionStartedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStarted;
    std::string chat_id;
    std::string turn_id;
    TurnKind kind = TurnKind::Answer;
    ModePolicy policy = ModePolicy::AnswerSafe;

    SessionStartedEvent() { type_tag = TAG; }
};

struct ChunkDeliveredEvent : Event {
    static constexpr const char* TAG = event_tags::ChunkDelivered;
    std::string chat_id;
    std::string turn_id;
    size_t index = 0;

    ChunkDeliveredEvent() { type_tag = TAG; }
};

struct SessionFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionFinished;
    DeliveryOutcome outcome;

    SessionFinishedEvent() { type_tag = TAG; }
};

// An interrupt was queued behind an AnswerSafe delivery
struct TurnDeferredEvent : Event {
    static constexpr const char* TAG = event_tags::TurnDeferred;
    std::string chat_id;
    std::string message_id;
    size_t pending = 0;

    TurnDeferredEvent() { type_tag = TAG; }
};

} // namespace chatpace
