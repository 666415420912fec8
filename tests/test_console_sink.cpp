#include <catch2/catch_test_macros.hpp>
#include "sinks/console_sink.hpp"
#include <sstream>

using namespace chatpace;

static MessageChunk chunk_of(size_t index, const std::string& text) {
    MessageChunk chunk;
    chunk.index = index;
    chunk.text = text;
    return chunk;
}

TEST_CASE("ConsoleSink: prints one line per chunk", "[console_sink]") {
    std::ostringstream out;
    ConsoleSink sink(out);

    REQUIRE(sink.send_chunk("42", chunk_of(0, "Hello world.")).ok());
    REQUIRE(sink.send_chunk("42", chunk_of(1, "Bye.")).ok());

    REQUIRE(out.str() == "[chat 42] Hello world.\n[chat 42] Bye.\n");
    REQUIRE(sink.sent_count() == 2);
    REQUIRE(sink.sink_name() == "console");
}

TEST_CASE("ConsoleSink: reply shows the quoted message", "[console_sink]") {
    std::ostringstream out;
    ConsoleSink sink(out);
    auto chunk = chunk_of(0, "Sure.");
    chunk.reply_to = "m3";

    sink.send_chunk("42", chunk);

    REQUIRE(out.str() == "[chat 42] > m3 Sure.\n");
}

TEST_CASE("ConsoleSink: typing marker only when shown", "[console_sink]") {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.set_typing("42", true);
    sink.set_typing("42", false);
    REQUIRE(out.str() == "[chat 42] (typing...)\n");

    std::ostringstream quiet;
    ConsoleSink silent(quiet, false);
    silent.set_typing("42", true);
    REQUIRE(quiet.str().empty());
}

TEST_CASE("ConsoleSink: broken stream is a permanent failure", "[console_sink]") {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    ConsoleSink sink(out);

    auto result = sink.send_chunk("42", chunk_of(0, "lost"));
    REQUIRE(result.status == DispatchStatus::Permanent);
    REQUIRE(sink.sent_count() == 0);
}
