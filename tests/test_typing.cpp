#include <catch2/catch_test_macros.hpp>
#include "typing.hpp"
#include "mock_sink.hpp"

using namespace chatpace;

TEST_CASE("TypingIndicatorController: show and hide reach the sink", "[typing]") {
    MockSink sink;
    RecordingSleep sleep;
    TypingIndicatorController typing(sink, TypingConfig{}, sleep.fn());

    typing.show("c1");
    typing.hide("c1");

    REQUIRE(sink.log() == std::vector<std::string>{"typing_on:c1", "typing_off:c1"});
}

TEST_CASE("TypingIndicatorController: disabled sends nothing", "[typing]") {
    MockSink sink;
    RecordingSleep sleep;
    TypingConfig cfg;
    cfg.enabled = false;
    TypingIndicatorController typing(sink, cfg, sleep.fn());

    typing.show("c1");
    typing.hide("c1");

    REQUIRE(sink.log().empty());
}

TEST_CASE("TypingIndicatorController: sink failure is not raised", "[typing]") {
    MockSink sink;
    sink.throw_on_typing = true;
    RecordingSleep sleep;
    TypingIndicatorController typing(sink, TypingConfig{}, sleep.fn());

    REQUIRE_NOTHROW(typing.show("c1"));
    REQUIRE_NOTHROW(typing.hide("c1"));
    REQUIRE(sink.log().size() == 2);
}

TEST_CASE("TypingIndicatorController: idle waits idle_ms", "[typing]") {
    MockSink sink;
    RecordingSleep sleep;
    TypingConfig cfg;
    cfg.idle_ms = 300;
    TypingIndicatorController typing(sink, cfg, sleep.fn());

    typing.idle();

    REQUIRE(sleep.waits() == std::vector<long long>{300});
    REQUIRE(sink.log().empty());
}

TEST_CASE("TypingIndicatorController: zero idle does not wait", "[typing]") {
    MockSink sink;
    RecordingSleep sleep;
    TypingConfig cfg;
    cfg.idle_ms = 0;
    TypingIndicatorController typing(sink, cfg, sleep.fn());

    typing.idle();

    REQUIRE(sleep.waits().empty());
}
