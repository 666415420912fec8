#pragma once
#include <optional>
#include <string>

namespace chatpace {

// Interruption policy of a delivery.
//   ReplySafe  - a new user message cancels the delivery; the next
//                response replies to the interrupted turn.
//   AnswerSafe - the delivery finishes; the new message is answered after.
enum class ModePolicy { ReplySafe, AnswerSafe };

const char* mode_policy_name(ModePolicy policy);

// Configured reply mode: "auto" leaves the choice to the conversation,
// "reply"/"answer" pin it.
enum class ReplyMode { Auto, Reply, Answer };

const char* reply_mode_name(ReplyMode mode);
ReplyMode parse_reply_mode(const std::string& name);   // throws ConfigError

struct ChatContext {
    std::string chat_id;
    // Set when the bot is explicitly replying to a specific prior message
    std::optional<std::string> replying_to;
    // Turn whose delivery the new user message cut short
    std::optional<std::string> interrupted_turn;
    ReplyMode reply_mode = ReplyMode::Auto;
};

ModePolicy mode_for(const ChatContext& context);

} // namespace chatpace
