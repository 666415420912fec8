#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace chatpace {

enum class SplitMode { None, Simple, SimpleImproved, Markdown, Structured };

const char* split_mode_name(SplitMode mode);

// Parse a config string ("none", "simple", "simple_improved", "markdown",
// "structured"). Throws ConfigError for anything else.
SplitMode parse_split_mode(const std::string& name);

// Lengths are counted in UTF-8 code points.
struct SplitConfig {
    SplitMode mode = SplitMode::SimpleImproved;
    size_t max_chunk_length = 400;
    size_t min_chunk_length = 80;
};

// Throws ConfigError if max_chunk_length is 0 or min exceeds max.
void validate(const SplitConfig& config);

// One chunk of a split response. `separator` is the whitespace that
// followed the chunk in the source; text + separator over all chunks
// reproduces the source exactly.
struct ChunkText {
    std::string text;
    std::string separator;
};

std::vector<ChunkText> split_chunks(const std::string& text, SplitMode mode,
                                    const SplitConfig& config);

// Chunk texts only, boundary whitespace dropped.
std::vector<std::string> split(const std::string& text, SplitMode mode,
                               const SplitConfig& config);
std::vector<std::string> split(const std::string& text, const SplitConfig& config);

std::string join_chunks(const std::vector<ChunkText>& chunks);

// ── Boundary search (shared with StreamAdapter) ─────────────────

// Byte range [begin, end) that must not contain a chunk boundary.
struct Span {
    size_t begin;
    size_t end;
};

// Fenced code blocks and inline formatting spans. With complete == false
// the text may still grow, so an unterminated span runs to the end.
std::vector<Span> protected_spans(const std::string& text, bool complete);

// Chunk [begin, text_end) followed by separator [text_end, next_begin).
struct Cut {
    size_t text_end;
    size_t next_begin;
};

// Find where the chunk starting at `begin` ends. `spans` (may be null)
// lists ranges a boundary must avoid; when no unprotected boundary fits,
// the plain rule applies. With complete == false, returns nullopt until
// more text can no longer move the cut. Returns nullopt when only
// whitespace remains. Whitespace at `begin` stays in the chunk but does
// not count towards the limit.
std::optional<Cut> find_cut(const std::string& text, size_t begin,
                            size_t max_chunk_length,
                            const std::vector<Span>* spans,
                            bool complete);

} // namespace chatpace
