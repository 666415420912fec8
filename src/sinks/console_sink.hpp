#pragma once
#include "../sink.hpp"
#include <iosfwd>
#include <mutex>
#include <string>

namespace chatpace {

// Prints deliveries to a stream, one line per chunk:
//   [chat 42] Hello world.
//   [chat 42] (typing...)
// Replies are prefixed with "> <message id>" on their first chunk.
class ConsoleSink : public Sink {
public:
    explicit ConsoleSink(std::ostream& out, bool show_typing = true);

    std::string sink_name() const override { return "console"; }
    DispatchResult send_chunk(const std::string& chat_id,
                              const MessageChunk& chunk) override;
    void set_typing(const std::string& chat_id, bool typing) override;

    size_t sent_count() const;

private:
    std::ostream& out_;
    bool show_typing_;
    mutable std::mutex mutex_;
    size_t sent_ = 0;
};

} // namespace chatpace
