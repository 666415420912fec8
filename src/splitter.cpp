#include "splitter.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace chatpace {

const char* split_mode_name(SplitMode mode) {
    switch (mode) {
        case SplitMode::None: return "none";
        case SplitMode::Simple: return "simple";
        case SplitMode::SimpleImproved: return "simple_improved";
        case SplitMode::Markdown: return "markdown";
        case SplitMode::Structured: return "structured";
    }
    return "none";
}

SplitMode parse_split_mode(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "none") return SplitMode::None;
    if (n == "simple") return SplitMode::Simple;
    if (n == "simple_improved") return SplitMode::SimpleImproved;
    if (n == "markdown") return SplitMode::Markdown;
    if (n == "structured") return SplitMode::Structured;
    throw ConfigError("Unknown split mode: " + name);
}

void validate(const SplitConfig& config) {
    if (config.max_chunk_length == 0) {
        throw ConfigError("max_chunk_length must be positive");
    }
    if (config.min_chunk_length > config.max_chunk_length) {
        throw ConfigError("min_chunk_length (" + std::to_string(config.min_chunk_length) +
                          ") exceeds max_chunk_length (" +
                          std::to_string(config.max_chunk_length) + ")");
    }
}

// ── Protected spans ─────────────────────────────────────────────

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

size_t line_end(const std::string& t, size_t pos) {
    size_t nl = t.find('\n', pos);
    return nl == std::string::npos ? t.size() : nl + 1;
}

// Fence character ('`' or '~') when the line at line_start is a fence
// line, 0 otherwise.
char fence_marker(const std::string& t, size_t line_start) {
    size_t i = line_start;
    int indent = 0;
    while (i < t.size() && t[i] == ' ' && indent < 3) { ++i; ++indent; }
    if (i + 3 > t.size()) return 0;
    char c = t[i];
    if (c != '`' && c != '~') return 0;
    if (t[i + 1] != c || t[i + 2] != c) return 0;
    return c;
}

std::vector<Span> fenced_blocks(const std::string& t) {
    std::vector<Span> blocks;
    size_t pos = 0;
    while (pos < t.size()) {
        char c = fence_marker(t, pos);
        if (c == 0) {
            pos = line_end(t, pos);
            continue;
        }
        // An unterminated fence runs to the end of the text
        size_t close = t.size();
        size_t resume = t.size();
        for (size_t p = line_end(t, pos); p < t.size(); p = line_end(t, p)) {
            if (fence_marker(t, p) == c) {
                size_t nl = t.find('\n', p);
                close = nl == std::string::npos ? t.size() : nl;
                resume = line_end(t, p);
                break;
            }
        }
        blocks.push_back(Span{pos, close});
        pos = resume;
    }
    return blocks;
}

size_t paragraph_stop(const std::string& t, size_t from, size_t to) {
    size_t p = t.find("\n\n", from);
    return (p == std::string::npos || p > to) ? to : p;
}

// Position of the closing `marker` in [from, stop) whose preceding char
// is not whitespace, or npos.
size_t find_closer(const std::string& t, const std::string& marker,
                   size_t from, size_t stop) {
    size_t p = from;
    while (p < stop) {
        p = t.find(marker, p);
        if (p == std::string::npos || p + marker.size() > stop) return std::string::npos;
        if (p > from && !is_space(t[p - 1])) return p;
        ++p;
    }
    return std::string::npos;
}

size_t run_length(const std::string& t, size_t pos, char c, size_t to) {
    size_t n = 0;
    while (pos + n < to && t[pos + n] == c) ++n;
    return n;
}

// End of the inline span opened at i, npos if i opens none. `open_ended`
// is set when the span is still unterminated at `stop`.
size_t inline_span_end(const std::string& t, size_t i, size_t stop, bool& open_ended) {
    open_ended = false;
    char c = t[i];

    if (c == '`') {
        size_t run = run_length(t, i, '`', stop);
        size_t p = i + run;
        while (p < stop) {
            p = t.find('`', p);
            if (p == std::string::npos || p >= stop) break;
            size_t r = run_length(t, p, '`', stop);
            if (r == run) return p + r;
            p += r;
        }
        open_ended = true;
        return std::string::npos;
    }

    if (c == '[') {
        size_t close = t.find(']', i + 1);
        if (close == std::string::npos || close >= stop) {
            open_ended = true;
            return std::string::npos;
        }
        if (close + 1 >= stop) {
            open_ended = close + 1 == stop;
            return std::string::npos;
        }
        if (t[close + 1] != '(') return std::string::npos;
        size_t paren = t.find(')', close + 2);
        if (paren == std::string::npos || paren >= stop) {
            open_ended = true;
            return std::string::npos;
        }
        return paren + 1;
    }

    if (c != '*' && c != '_' && c != '~') return std::string::npos;

    bool doubled = i + 1 < stop && t[i + 1] == c;
    if (c == '~' && !doubled) return std::string::npos;
    std::string marker = doubled ? std::string(2, c) : std::string(1, c);
    size_t body = i + marker.size();
    if (body >= stop || is_space(t[body])) return std::string::npos;
    // intra-word underscores (snake_case) are not emphasis
    if (c == '_' && i > 0 && is_word(t[i - 1])) return std::string::npos;

    size_t close = find_closer(t, marker, body, stop);
    while (close != std::string::npos && c == '_' && close + marker.size() < stop &&
           is_word(t[close + marker.size()])) {
        close = find_closer(t, marker, close + 1, stop);
    }
    if (close == std::string::npos) {
        open_ended = true;
        return std::string::npos;
    }
    return close + marker.size();
}

void inline_spans(const std::string& t, size_t from, size_t to, bool complete,
                  std::vector<Span>& out) {
    size_t i = from;
    while (i < to) {
        char c = t[i];
        if (c != '`' && c != '*' && c != '_' && c != '~' && c != '[') {
            ++i;
            continue;
        }
        size_t stop = paragraph_stop(t, i, to);
        bool open_ended = false;
        size_t end = inline_span_end(t, i, stop, open_ended);
        if (end != std::string::npos) {
            out.push_back(Span{i, end});
            i = end;
            continue;
        }
        // The closer may still arrive when the text is incomplete
        if (open_ended && !complete && stop == to && to == t.size()) {
            out.push_back(Span{i, to});
            return;
        }
        ++i;
    }
}

bool inside(const std::vector<Span>& spans, size_t pos) {
    for (const auto& s : spans) {
        if (s.begin < pos && pos < s.end) return true;
    }
    return false;
}

bool is_closer(char c) {
    switch (c) {
        case '"': case '\'': case ')': case ']': case '*': case '_':
            return true;
        default:
            return false;
    }
}

bool ends_sentence(const std::string& t, size_t begin, size_t end) {
    size_t j = end;
    while (j > begin && is_closer(t[j - 1])) --j;
    if (j == begin) return false;
    char c = t[j - 1];
    if (c == '.' || c == '!' || c == '?') return true;
    // U+2026 HORIZONTAL ELLIPSIS
    return j - begin >= 3 && t.compare(j - 3, 3, "\xE2\x80\xA6") == 0;
}

bool run_has_newline(const std::string& t, size_t pos) {
    while (pos < t.size() && is_space(t[pos])) {
        if (t[pos] == '\n') return true;
        ++pos;
    }
    return false;
}

// Largest chunk end in (begin, limit]: sentence, line or paragraph ends
// win over plain word gaps.
std::optional<size_t> best_boundary(const std::string& t, size_t begin, size_t limit,
                                    const std::vector<Span>* spans) {
    std::optional<size_t> strong;
    std::optional<size_t> weak;
    for (size_t e = begin + 1; e <= limit && e < t.size(); ++e) {
        if (!is_space(t[e]) || is_space(t[e - 1])) continue;
        if (spans && inside(*spans, e)) continue;
        if (run_has_newline(t, e) || ends_sentence(t, begin, e)) {
            strong = e;
        } else {
            weak = e;
        }
    }
    return strong ? strong : weak;
}

} // namespace

std::vector<Span> protected_spans(const std::string& text, bool complete) {
    std::vector<Span> spans = fenced_blocks(text);
    std::vector<Span> result;
    size_t pos = 0;
    for (const auto& block : spans) {
        inline_spans(text, pos, block.begin, true, result);
        result.push_back(block);
        pos = std::min(text.size(), block.end);
    }
    inline_spans(text, pos, text.size(), complete, result);
    std::sort(result.begin(), result.end(),
              [](const Span& a, const Span& b) { return a.begin < b.begin; });
    return result;
}

// ── Boundary search ─────────────────────────────────────────────

std::optional<Cut> find_cut(const std::string& text, size_t begin,
                            size_t max_chunk_length,
                            const std::vector<Span>* spans,
                            bool complete) {
    const size_t n = text.size();
    size_t content_end = n;
    while (content_end > begin && is_space(text[content_end - 1])) --content_end;
    if (content_end <= begin) return std::nullopt;

    // Leading whitespace rides along with the first token
    size_t start = begin;
    while (is_space(text[start])) ++start;

    if (utf8_length(text, start, content_end) <= max_chunk_length) {
        if (!complete) return std::nullopt;
        return Cut{content_end, n};
    }

    // Non-whitespace exists past `limit`, so every gap up to it is final.
    size_t limit = utf8_advance(text, start, max_chunk_length);
    std::optional<size_t> end;
    if (spans && !spans->empty()) end = best_boundary(text, start, limit, spans);
    if (!end) end = best_boundary(text, start, limit, nullptr);

    if (!end) {
        // Unbreakable token longer than the limit: emit it whole
        size_t e = limit;
        while (e < content_end && !is_space(text[e])) ++e;
        if (e >= content_end) {
            if (!complete) return std::nullopt;
            return Cut{content_end, n};
        }
        end = e;
    }

    size_t next = *end;
    while (next < n && is_space(text[next])) ++next;
    return Cut{*end, next};
}

// ── Splitting ───────────────────────────────────────────────────

namespace {

std::vector<ChunkText> split_on_boundaries(const std::string& text,
                                           const SplitConfig& config,
                                           bool protect_markup) {
    if (trim(text).empty()) return {ChunkText{text, {}}};

    std::vector<Span> spans;
    if (protect_markup) spans = protected_spans(text, true);

    std::vector<ChunkText> chunks;
    size_t begin = 0;
    while (begin < text.size()) {
        auto cut = find_cut(text, begin, config.max_chunk_length,
                            protect_markup ? &spans : nullptr, true);
        if (!cut) break;
        chunks.push_back(ChunkText{
            text.substr(begin, cut->text_end - begin),
            text.substr(cut->text_end, cut->next_begin - cut->text_end)});
        begin = cut->next_begin;
    }
    return chunks;
}

void absorb(ChunkText& into, const ChunkText& next) {
    into.text += into.separator;
    into.text += next.text;
    into.separator = next.separator;
}

std::vector<ChunkText> merge_short(std::vector<ChunkText> chunks, const SplitConfig& config) {
    std::vector<ChunkText> merged;
    merged.reserve(chunks.size());
    for (auto& chunk : chunks) {
        if (!merged.empty()) {
            auto& prev = merged.back();
            size_t prev_len = utf8_length(prev.text);
            size_t joined = prev_len + utf8_length(prev.separator) + utf8_length(chunk.text);
            if (prev_len < config.min_chunk_length && joined <= config.max_chunk_length) {
                absorb(prev, chunk);
                continue;
            }
        }
        merged.push_back(std::move(chunk));
    }

    // A short tail is never sent on its own, even if that overshoots the limit
    if (merged.size() >= 2 && utf8_length(merged.back().text) < config.min_chunk_length) {
        ChunkText tail = std::move(merged.back());
        merged.pop_back();
        absorb(merged.back(), tail);
    }
    return merged;
}

std::vector<ChunkText> split_structural(const std::string& /*text*/, SplitMode mode) {
    throw SplitError(std::string(split_mode_name(mode)) + " splitting is not available");
}

} // namespace

std::vector<ChunkText> split_chunks(const std::string& text, SplitMode mode,
                                    const SplitConfig& config) {
    validate(config);
    if (text.empty()) return {ChunkText{}};

    switch (mode) {
        case SplitMode::None:
            return {ChunkText{text, {}}};
        case SplitMode::Simple:
            return split_on_boundaries(text, config, false);
        case SplitMode::SimpleImproved:
            return merge_short(split_on_boundaries(text, config, true), config);
        case SplitMode::Markdown:
        case SplitMode::Structured:
            try {
                return split_structural(text, mode);
            } catch (const SplitError& e) {
                std::cerr << "[splitter] " << e.what() << ", sending whole text\n";
                return {ChunkText{text, {}}};
            }
    }
    return {ChunkText{text, {}}};
}

std::vector<std::string> split(const std::string& text, SplitMode mode,
                               const SplitConfig& config) {
    std::vector<std::string> parts;
    for (auto& chunk : split_chunks(text, mode, config)) {
        parts.push_back(std::move(chunk.text));
    }
    return parts;
}

std::vector<std::string> split(const std::string& text, const SplitConfig& config) {
    return split(text, config.mode, config);
}

std::string join_chunks(const std::vector<ChunkText>& chunks) {
    std::string out;
    for (const auto& chunk : chunks) {
        out += chunk.text;
        out += chunk.separator;
    }
    return out;
}

} // namespace chatpace
