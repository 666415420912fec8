#include <catch2/catch_test_macros.hpp>
#include "plan.hpp"
#include "errors.hpp"

using namespace chatpace;

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

static RawResponse response_of(const std::string& text, SplitMode mode = SplitMode::Simple) {
    RawResponse response;
    response.request_id = "r1";
    response.text = text;
    response.mode = mode;
    return response;
}

TEST_CASE("build_plan: chunks indexed and stamped with delays", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    DelayPolicy delays(constant_delay(120));

    auto plan = build_plan(response_of("Hello world. This is a test."), ctx,
                           simple_limits(15), delays);

    REQUIRE(plan.chat_id == "c1");
    REQUIRE(plan.turn_id == "r1");
    REQUIRE(plan.kind == TurnKind::Answer);
    REQUIRE(plan.mode_policy == ModePolicy::AnswerSafe);
    REQUIRE(plan.chunks.size() == 2);
    for (size_t i = 0; i < plan.chunks.size(); ++i) {
        REQUIRE(plan.chunks[i].index == i);
        REQUIRE(plan.chunks[i].estimated_delay_ms == 120);
    }
    REQUIRE(plan.chunks[0].text == "Hello world.");
    REQUIRE(plan.chunks[1].text == "This is a test.");
}

TEST_CASE("build_plan: reply quotes the message on the first chunk only", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    ctx.replying_to = "m42";
    DelayPolicy delays(constant_delay(0));

    auto plan = build_plan(response_of("Hello world. This is a test."), ctx,
                           simple_limits(15), delays);

    REQUIRE(plan.kind == TurnKind::Reply);
    REQUIRE(plan.mode_policy == ModePolicy::ReplySafe);
    REQUIRE(plan.reply_to == std::optional<std::string>("m42"));
    REQUIRE(plan.chunks[0].reply_to == std::optional<std::string>("m42"));
    REQUIRE_FALSE(plan.chunks[1].reply_to.has_value());
}

TEST_CASE("build_plan: interrupted turn makes a Reply", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    ctx.interrupted_turn = "t-old";
    DelayPolicy delays(constant_delay(0));

    auto plan = build_plan(response_of("Sure."), ctx, simple_limits(100), delays);

    REQUIRE(plan.kind == TurnKind::Reply);
    REQUIRE(plan.interrupted_turn == std::optional<std::string>("t-old"));
}

TEST_CASE("build_plan: response reply_to overrides the context", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    ctx.replying_to = "m1";
    DelayPolicy delays(constant_delay(0));
    auto response = response_of("Ok.");
    response.reply_to = "m2";

    auto plan = build_plan(response, ctx, simple_limits(100), delays);

    REQUIRE(plan.chunks[0].reply_to == std::optional<std::string>("m2"));
}

TEST_CASE("build_plan: missing request id gets a generated turn id", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    DelayPolicy delays(constant_delay(0));
    auto response = response_of("Ok.");
    response.request_id.clear();

    auto a = build_plan(response, ctx, simple_limits(100), delays);
    auto b = build_plan(response, ctx, simple_limits(100), delays);

    REQUIRE_FALSE(a.turn_id.empty());
    REQUIRE(a.turn_id != b.turn_id);
}

TEST_CASE("build_plan: invalid split config is a ConfigError", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    DelayPolicy delays(constant_delay(0));
    SplitConfig bad = simple_limits(10);
    bad.min_chunk_length = 50;

    REQUIRE_THROWS_AS(build_plan(response_of("text"), ctx, bad, delays), ConfigError);
}

TEST_CASE("build_plan: None mode sends one chunk", "[plan]") {
    ChatContext ctx;
    ctx.chat_id = "c1";
    DelayPolicy delays(constant_delay(0));

    auto plan = build_plan(response_of("One. Two. Three.", SplitMode::None), ctx,
                           simple_limits(5), delays);

    REQUIRE(plan.chunks.size() == 1);
    REQUIRE(plan.chunks[0].text == "One. Two. Three.");
}

TEST_CASE("turn_kind_name: names", "[plan]") {
    REQUIRE(std::string(turn_kind_name(TurnKind::Answer)) == "answer");
    REQUIRE(std::string(turn_kind_name(TurnKind::Reply)) == "reply");
}
