#include "console_sink.hpp"
#include <ostream>

namespace chatpace {

ConsoleSink::ConsoleSink(std::ostream& out, bool show_typing)
    : out_(out), show_typing_(show_typing)
{}

DispatchResult ConsoleSink::send_chunk(const std::string& chat_id,
                                       const MessageChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_) return DispatchResult::permanent("console stream is not writable");

    out_ << "[chat " << chat_id << "] ";
    if (chunk.reply_to) out_ << "> " << *chunk.reply_to << ' ';
    out_ << chunk.text << '\n' << std::flush;
    if (!out_) return DispatchResult::transient("console write failed");

    ++sent_;
    return DispatchResult::ack();
}

void ConsoleSink::set_typing(const std::string& chat_id, bool typing) {
    if (!show_typing_ || !typing) return;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[chat " << chat_id << "] (typing...)\n" << std::flush;
}

size_t ConsoleSink::sent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

} // namespace chatpace
