#include "stream_adapter.hpp"
#include <stdexcept>

namespace chatpace {

StreamAdapter::StreamAdapter(SplitMode mode, const SplitConfig& config,
                             std::optional<std::string> reply_to)
    : mode_(mode), config_(config), reply_to_(std::move(reply_to)) {
    validate(config_);
}

bool StreamAdapter::splits() const {
    return mode_ == SplitMode::Simple || mode_ == SplitMode::SimpleImproved;
}

std::vector<MessageChunk> StreamAdapter::feed(const std::string& delta) {
    if (finished_) throw std::logic_error("StreamAdapter: feed after finish");
    std::vector<MessageChunk> out;
    buffer_ += delta;
    if (splits()) drain(false, out);
    return out;
}

std::vector<MessageChunk> StreamAdapter::finish() {
    if (finished_) return {};
    finished_ = true;

    std::vector<MessageChunk> out;
    if (splits()) drain(true, out);

    // Whole-text modes, empty streams and whitespace-only streams
    if (begin_ < buffer_.size() || next_index_ == 0) {
        emit(buffer_.size(), buffer_.size(), out);
    }
    return out;
}

void StreamAdapter::drain(bool complete, std::vector<MessageChunk>& out) {
    std::vector<Span> spans;
    bool protect = mode_ == SplitMode::SimpleImproved;
    if (protect) spans = protected_spans(buffer_, complete);

    while (begin_ < buffer_.size()) {
        auto cut = find_cut(buffer_, begin_, config_.max_chunk_length,
                            protect ? &spans : nullptr, complete);
        if (!cut) break;
        emit(cut->text_end, cut->next_begin, out);
    }
}

void StreamAdapter::emit(size_t text_end, size_t next_begin,
                         std::vector<MessageChunk>& out) {
    MessageChunk chunk;
    chunk.index = next_index_++;
    chunk.text = buffer_.substr(begin_, text_end - begin_);
    chunk.separator = buffer_.substr(text_end, next_begin - text_end);
    if (chunk.index == 0) chunk.reply_to = reply_to_;
    out.push_back(std::move(chunk));
    begin_ = next_begin;
}

} // namespace chatpace
