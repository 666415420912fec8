#pragma once
#include "delay_policy.hpp"
#include "sink.hpp"
#include "stream_adapter.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace chatpace {

// Ordered supply of chunks for one delivery session.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    // Next chunk in order; nullopt once exhausted or interrupted. May block.
    virtual std::optional<MessageChunk> next() = 0;

    // True once every chunk has been handed out
    virtual bool exhausted() const = 0;

    // Wake a blocked next(); called when the session is cancelled
    virtual void interrupt() {}
};

// Chunks of a fully built plan.
class PlanChunkSource : public ChunkSource {
public:
    explicit PlanChunkSource(std::vector<MessageChunk> chunks);

    std::optional<MessageChunk> next() override;
    bool exhausted() const override;

private:
    std::vector<MessageChunk> chunks_;
    size_t pos_ = 0;
};

// Chunks of a streamed response. A producer thread push()es deltas and
// close()s; the session thread consumes stable chunks as they appear,
// each stamped with its delay.
class StreamChunkSource : public ChunkSource {
public:
    StreamChunkSource(SplitMode mode, const SplitConfig& split_config,
                      const DelaySpec& delay_spec,
                      std::optional<std::string> reply_to = std::nullopt);

    void push(const std::string& delta);
    void close();

    std::optional<MessageChunk> next() override;
    bool exhausted() const override;
    void interrupt() override;

    // Everything streamed so far
    std::string text() const;

private:
    void enqueue(std::vector<MessageChunk> chunks);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    StreamAdapter adapter_;
    DelayPolicy delays_;
    std::deque<MessageChunk> ready_;
    bool closed_ = false;
    bool interrupted_ = false;
};

} // namespace chatpace
