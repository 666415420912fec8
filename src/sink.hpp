#pragma once
#include "errors.hpp"
#include <string>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace chatpace {

// One outbound message of a split response. Immutable once produced.
struct MessageChunk {
    size_t index = 0;
    std::string text;
    std::string separator;                 // source whitespace after text
    uint64_t estimated_delay_ms = 0;
    std::optional<std::string> reply_to;   // message the chunk quotes
};

enum class DispatchStatus { Ack, Transient, Permanent };

struct DispatchResult {
    DispatchStatus status = DispatchStatus::Ack;
    std::string error;

    static DispatchResult ack() { return {}; }
    static DispatchResult transient(std::string why) {
        return {DispatchStatus::Transient, std::move(why)};
    }
    static DispatchResult permanent(std::string why) {
        return {DispatchStatus::Permanent, std::move(why)};
    }

    bool ok() const { return status == DispatchStatus::Ack; }
};

// Outbound side of a chat platform. Implementations must be callable from
// several session threads at once (one per chat).
class Sink {
public:
    virtual ~Sink() = default;

    virtual std::string sink_name() const = 0;

    // Deliver one chunk. May also throw DispatchError; any other exception
    // counts as a transient failure.
    virtual DispatchResult send_chunk(const std::string& chat_id,
                                      const MessageChunk& chunk) = 0;

    // Toggle the "composing" indicator
    virtual void set_typing(const std::string& chat_id, bool typing) = 0;
};

// Invoke sink.send_chunk and fold thrown errors into a DispatchResult.
DispatchResult dispatch_once(Sink& sink, const std::string& chat_id,
                             const MessageChunk& chunk);

} // namespace chatpace
