#include "chunk_source.hpp"

namespace chatpace {

PlanChunkSource::PlanChunkSource(std::vector<MessageChunk> chunks)
    : chunks_(std::move(chunks))
{}

std::optional<MessageChunk> PlanChunkSource::next() {
    if (pos_ >= chunks_.size()) return std::nullopt;
    return chunks_[pos_++];
}

bool PlanChunkSource::exhausted() const {
    return pos_ >= chunks_.size();
}

StreamChunkSource::StreamChunkSource(SplitMode mode, const SplitConfig& split_config,
                                     const DelaySpec& delay_spec,
                                     std::optional<std::string> reply_to)
    : adapter_(mode, split_config, std::move(reply_to)), delays_(delay_spec)
{}

void StreamChunkSource::push(const std::string& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    enqueue(adapter_.feed(delta));
}

void StreamChunkSource::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        enqueue(adapter_.finish());
        closed_ = true;
    }
    cv_.notify_all();
}

void StreamChunkSource::enqueue(std::vector<MessageChunk> chunks) {
    if (chunks.empty()) return;
    for (auto& chunk : chunks) {
        chunk.estimated_delay_ms = static_cast<uint64_t>(delays_.next_delay(chunk).count());
        ready_.push_back(std::move(chunk));
    }
    cv_.notify_all();
}

std::optional<MessageChunk> StreamChunkSource::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !ready_.empty() || closed_ || interrupted_; });
    if (interrupted_ || ready_.empty()) return std::nullopt;
    MessageChunk chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
}

bool StreamChunkSource::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && ready_.empty();
}

void StreamChunkSource::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

std::string StreamChunkSource::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapter_.text();
}

} // namespace chatpace
