#pragma once
#include "delay_policy.hpp"
#include "mode_selector.hpp"
#include "sink.hpp"
#include "splitter.hpp"
#include <string>
#include <vector>
#include <optional>

namespace chatpace {

// Answer: an independent turn. Reply: references an earlier (usually
// interrupted) turn.
enum class TurnKind { Answer, Reply };

const char* turn_kind_name(TurnKind kind);

struct RawResponse {
    std::string request_id;
    std::string text;
    SplitMode mode = SplitMode::SimpleImproved;
    std::optional<std::string> reply_to;
};

// Immutable once built; one per generated response.
struct DeliveryPlan {
    std::string chat_id;
    std::string turn_id;
    TurnKind kind = TurnKind::Answer;
    std::optional<std::string> reply_to;
    std::optional<std::string> interrupted_turn;
    ModePolicy mode_policy = ModePolicy::AnswerSafe;
    std::vector<MessageChunk> chunks;
};

// Split `response` and stamp each chunk with its delay. Throws
// ConfigError for invalid split limits or delay bounds.
DeliveryPlan build_plan(const RawResponse& response,
                        const ChatContext& context,
                        const SplitConfig& split_config,
                        DelayPolicy& delays);

// Turn split output into indexed chunks (delays left at 0). The first
// chunk carries `reply_to`.
std::vector<MessageChunk> make_chunks(std::vector<ChunkText> parts,
                                      const std::optional<std::string>& reply_to);

} // namespace chatpace
