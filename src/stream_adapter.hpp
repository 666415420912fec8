#pragma once
#include "sink.hpp"
#include "splitter.hpp"
#include <string>
#include <vector>
#include <optional>

namespace chatpace {

// Incremental splitter for streamed responses. A chunk is emitted only
// once text arriving later can no longer move or extend its boundary;
// emitted chunks are final. Chunk indices continue across feed() calls.
class StreamAdapter {
public:
    StreamAdapter(SplitMode mode, const SplitConfig& config,
                  std::optional<std::string> reply_to = std::nullopt);

    // Append a delta; returns chunks that became stable
    std::vector<MessageChunk> feed(const std::string& delta);

    // End of stream: flush everything left, however short
    std::vector<MessageChunk> finish();

    bool finished() const { return finished_; }
    const std::string& text() const { return buffer_; }
    size_t emitted_count() const { return next_index_; }

private:
    bool splits() const;
    void drain(bool complete, std::vector<MessageChunk>& out);
    void emit(size_t text_end, size_t next_begin, std::vector<MessageChunk>& out);

    SplitMode mode_;
    SplitConfig config_;
    std::optional<std::string> reply_to_;
    std::string buffer_;
    size_t begin_ = 0;        // first byte not yet emitted
    size_t next_index_ = 0;
    bool finished_ = false;
};

} // namespace chatpace
