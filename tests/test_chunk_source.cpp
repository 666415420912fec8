#include <catch2/catch_test_macros.hpp>
#include "chunk_source.hpp"
#include <future>
#include <thread>

using namespace chatpace;

static MessageChunk chunk_of(size_t index, const std::string& text) {
    MessageChunk chunk;
    chunk.index = index;
    chunk.text = text;
    return chunk;
}

static SplitConfig simple_limits(size_t max_len) {
    SplitConfig cfg;
    cfg.mode = SplitMode::Simple;
    cfg.max_chunk_length = max_len;
    cfg.min_chunk_length = 0;
    return cfg;
}

static DelaySpec constant_delay(uint32_t ms) {
    DelaySpec spec;
    spec.strategy = DelayStrategy::Constant;
    spec.min_ms = ms;
    spec.max_ms = ms;
    return spec;
}

TEST_CASE("PlanChunkSource: yields chunks in order", "[chunk_source]") {
    PlanChunkSource source({chunk_of(0, "a"), chunk_of(1, "b")});

    REQUIRE_FALSE(source.exhausted());
    REQUIRE(source.next()->text == "a");
    REQUIRE(source.next()->text == "b");
    REQUIRE(source.exhausted());
    REQUIRE_FALSE(source.next().has_value());
}

TEST_CASE("StreamChunkSource: chunks stamped with delays", "[chunk_source]") {
    StreamChunkSource source(SplitMode::Simple, simple_limits(15), constant_delay(70));
    source.push("Hello world. This is a test.");
    source.close();

    auto first = source.next();
    auto second = source.next();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->text == "Hello world.");
    REQUIRE(first->estimated_delay_ms == 70);
    REQUIRE(second->text == "This is a test.");
    REQUIRE(second->estimated_delay_ms == 70);
    REQUIRE_FALSE(source.next().has_value());
    REQUIRE(source.exhausted());
    REQUIRE(source.text() == "Hello world. This is a test.");
}

TEST_CASE("StreamChunkSource: consumer waits for the producer", "[chunk_source]") {
    StreamChunkSource source(SplitMode::Simple, simple_limits(400), constant_delay(0));

    auto consumer = std::async(std::launch::async, [&source] {
        std::vector<std::string> texts;
        while (auto chunk = source.next()) texts.push_back(chunk->text);
        return texts;
    });

    source.push("Hel");
    source.push("lo wor");
    source.push("ld.");
    source.close();

    auto texts = consumer.get();
    REQUIRE(texts == std::vector<std::string>{"Hello world."});
    REQUIRE(source.exhausted());
}

TEST_CASE("StreamChunkSource: interrupt wakes a blocked consumer", "[chunk_source]") {
    StreamChunkSource source(SplitMode::Simple, simple_limits(400), constant_delay(0));

    auto consumer = std::async(std::launch::async, [&source] {
        return source.next().has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    source.interrupt();

    REQUIRE_FALSE(consumer.get());
    REQUIRE_FALSE(source.exhausted());
}

TEST_CASE("StreamChunkSource: push after close is ignored", "[chunk_source]") {
    StreamChunkSource source(SplitMode::None, simple_limits(400), constant_delay(0));
    source.push("done");
    source.close();
    source.push(" and more");

    REQUIRE(source.next()->text == "done");
    REQUIRE_FALSE(source.next().has_value());
}
