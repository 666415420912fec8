#include <catch2/catch_test_macros.hpp>
#include "stream_adapter.hpp"
#include "errors.hpp"
#include <stdexcept>

using namespace chatpace;

static SplitConfig limits(size_t max_len, size_t min_len = 0) {
    SplitConfig cfg;
    cfg.max_chunk_length = max_len;
    cfg.min_chunk_length = min_len;
    return cfg;
}

static std::string joined(const std::vector<MessageChunk>& chunks) {
    std::string out;
    for (const auto& c : chunks) out += c.text + c.separator;
    return out;
}

static void append(std::vector<MessageChunk>& into, std::vector<MessageChunk> more) {
    for (auto& c : more) into.push_back(std::move(c));
}

TEST_CASE("StreamAdapter: token stream reassembles the text", "[stream]") {
    StreamAdapter adapter(SplitMode::SimpleImproved, SplitConfig{});
    std::vector<MessageChunk> emitted;

    append(emitted, adapter.feed("Hel"));
    append(emitted, adapter.feed("lo wor"));
    append(emitted, adapter.feed("ld."));
    REQUIRE(emitted.empty());

    append(emitted, adapter.finish());
    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0].text == "Hello world.");
    REQUIRE(joined(emitted) == "Hello world.");
}

TEST_CASE("StreamAdapter: chunk emitted once the limit is passed", "[stream]") {
    StreamAdapter adapter(SplitMode::Simple, limits(15));

    REQUIRE(adapter.feed("Hello world. ").empty());

    auto first = adapter.feed("This is a test.");
    REQUIRE(first.size() == 1);
    REQUIRE(first[0].index == 0);
    REQUIRE(first[0].text == "Hello world.");
    REQUIRE(first[0].separator == " ");

    auto rest = adapter.finish();
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].index == 1);
    REQUIRE(rest[0].text == "This is a test.");
    REQUIRE(adapter.emitted_count() == 2);
}

TEST_CASE("StreamAdapter: emitted chunks never change", "[stream]") {
    std::string text = "One two three four. Five six seven eight nine. Ten eleven twelve.";
    StreamAdapter adapter(SplitMode::Simple, limits(20));
    std::vector<MessageChunk> emitted;
    std::vector<std::string> snapshot;

    for (char c : text) {
        append(emitted, adapter.feed(std::string(1, c)));
        // earlier chunks are the ones already seen
        for (size_t i = 0; i < snapshot.size(); ++i) {
            REQUIRE(emitted[i].text == snapshot[i]);
        }
        snapshot.clear();
        for (const auto& c2 : emitted) snapshot.push_back(c2.text);
    }
    append(emitted, adapter.finish());

    REQUIRE(joined(emitted) == text);
    for (size_t i = 0; i < emitted.size(); ++i) {
        REQUIRE(emitted[i].index == i);
    }
}

TEST_CASE("StreamAdapter: Simple stream matches batch split", "[stream]") {
    std::string text =
        "The quick brown fox jumps over the lazy dog. Pack my box with five dozen "
        "liquor jugs!\nHow vexingly quick daft zebras jump? Sphinx of black quartz, "
        "judge my vow.";
    auto cfg = limits(30);
    StreamAdapter adapter(SplitMode::Simple, cfg);
    std::vector<MessageChunk> emitted;
    for (size_t i = 0; i < text.size(); i += 4) {
        append(emitted, adapter.feed(text.substr(i, 4)));
    }
    append(emitted, adapter.finish());

    auto batch = split_chunks(text, SplitMode::Simple, cfg);
    REQUIRE(emitted.size() == batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        REQUIRE(emitted[i].text == batch[i].text);
        REQUIRE(emitted[i].separator == batch[i].separator);
    }
}

TEST_CASE("StreamAdapter: unterminated code span is not cut", "[stream]") {
    StreamAdapter adapter(SplitMode::SimpleImproved, limits(16));
    std::vector<MessageChunk> emitted;

    // the closing backtick has not arrived yet
    append(emitted, adapter.feed("Run `make all now"));
    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0].text == "Run");

    append(emitted, adapter.feed("` ok then"));
    append(emitted, adapter.finish());

    REQUIRE(emitted.size() == 3);
    REQUIRE(emitted[1].text == "`make all now`");
    REQUIRE(emitted[2].text == "ok then");
    REQUIRE(joined(emitted) == "Run `make all now` ok then");
}

TEST_CASE("StreamAdapter: None mode emits everything at finish", "[stream]") {
    StreamAdapter adapter(SplitMode::None, limits(5));
    REQUIRE(adapter.feed("A long sentence. ").empty());
    REQUIRE(adapter.feed("Another one.").empty());

    auto out = adapter.finish();
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].text == "A long sentence. Another one.");
}

TEST_CASE("StreamAdapter: empty stream yields one empty chunk", "[stream]") {
    StreamAdapter adapter(SplitMode::Simple, limits(10));
    auto out = adapter.finish();
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].text.empty());
    REQUIRE(adapter.finished());
    REQUIRE(adapter.finish().empty());
}

TEST_CASE("StreamAdapter: feed after finish throws", "[stream]") {
    StreamAdapter adapter(SplitMode::Simple, limits(10));
    adapter.finish();
    REQUIRE_THROWS_AS(adapter.feed("late"), std::logic_error);
}

TEST_CASE("StreamAdapter: reply_to on the first chunk only", "[stream]") {
    StreamAdapter adapter(SplitMode::Simple, limits(15), std::string("m9"));
    std::vector<MessageChunk> emitted;
    append(emitted, adapter.feed("Hello world. This is a test."));
    append(emitted, adapter.finish());

    REQUIRE(emitted.size() == 2);
    REQUIRE(emitted[0].reply_to == std::optional<std::string>("m9"));
    REQUIRE_FALSE(emitted[1].reply_to.has_value());
}

TEST_CASE("StreamAdapter: invalid config is a ConfigError", "[stream]") {
    REQUIRE_THROWS_AS(StreamAdapter(SplitMode::Simple, limits(10, 20)), ConfigError);
}

TEST_CASE("StreamAdapter: leading whitespace never becomes its own chunk", "[stream]") {
    StreamAdapter adapter(SplitMode::Simple, limits(5));
    std::vector<MessageChunk> emitted;

    append(emitted, adapter.feed("        "));
    append(emitted, adapter.feed("abc d"));
    REQUIRE(emitted.empty());
    append(emitted, adapter.feed("ef"));
    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0].text == "        abc");

    append(emitted, adapter.finish());
    REQUIRE(emitted.size() == 2);
    REQUIRE(emitted[1].text == "def");
    REQUIRE(joined(emitted) == "        abc def");
}
