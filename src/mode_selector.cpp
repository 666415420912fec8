#include "mode_selector.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace chatpace {

const char* mode_policy_name(ModePolicy policy) {
    switch (policy) {
        case ModePolicy::ReplySafe: return "reply_safe";
        case ModePolicy::AnswerSafe: return "answer_safe";
    }
    return "answer_safe";
}

const char* reply_mode_name(ReplyMode mode) {
    switch (mode) {
        case ReplyMode::Auto: return "auto";
        case ReplyMode::Reply: return "reply";
        case ReplyMode::Answer: return "answer";
    }
    return "auto";
}

ReplyMode parse_reply_mode(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "auto") return ReplyMode::Auto;
    if (n == "reply") return ReplyMode::Reply;
    if (n == "answer") return ReplyMode::Answer;
    throw ConfigError("Unknown reply mode: " + name);
}

ModePolicy mode_for(const ChatContext& context) {
    switch (context.reply_mode) {
        case ReplyMode::Reply: return ModePolicy::ReplySafe;
        case ReplyMode::Answer: return ModePolicy::AnswerSafe;
        case ReplyMode::Auto: break;
    }
    return context.replying_to ? ModePolicy::ReplySafe : ModePolicy::AnswerSafe;
}

} // namespace chatpace
