#pragma once
#include "errors.hpp"
#include <string>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace chatpace {

// Pending → TypingShown → Sending → {Completed | Cancelled | Failed}
enum class SessionStatus { Pending, TypingShown, Sending, Completed, Cancelled, Failed };

inline const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::TypingShown: return "typing_shown";
        case SessionStatus::Sending: return "sending";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Cancelled: return "cancelled";
        case SessionStatus::Failed: return "failed";
    }
    return "pending";
}

inline bool is_terminal(SessionStatus status) {
    return status == SessionStatus::Completed ||
           status == SessionStatus::Cancelled ||
           status == SessionStatus::Failed;
}

// Terminal report of one delivery session. Cancelled is a normal outcome;
// Failed carries the cause so callers can tell the user delivery was
// partial.
struct DeliveryOutcome {
    std::string chat_id;
    std::string turn_id;
    SessionStatus status = SessionStatus::Pending;
    size_t delivered_count = 0;
    uint64_t started_at = 0;    // epoch ms
    uint64_t finished_at = 0;   // epoch ms
    std::optional<DispatchErrorKind> failure;
    std::string error;
};

} // namespace chatpace
