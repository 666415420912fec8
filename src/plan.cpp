#include "plan.hpp"
#include "util.hpp"

namespace chatpace {

const char* turn_kind_name(TurnKind kind) {
    switch (kind) {
        case TurnKind::Answer: return "answer";
        case TurnKind::Reply: return "reply";
    }
    return "answer";
}

std::vector<MessageChunk> make_chunks(std::vector<ChunkText> parts,
                                      const std::optional<std::string>& reply_to) {
    std::vector<MessageChunk> chunks;
    chunks.reserve(parts.size());
    for (auto& part : parts) {
        MessageChunk chunk;
        chunk.index = chunks.size();
        chunk.text = std::move(part.text);
        chunk.separator = std::move(part.separator);
        if (chunk.index == 0) chunk.reply_to = reply_to;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

DeliveryPlan build_plan(const RawResponse& response,
                        const ChatContext& context,
                        const SplitConfig& split_config,
                        DelayPolicy& delays) {
    validate(split_config);
    validate(delays.spec());

    DeliveryPlan plan;
    plan.chat_id = context.chat_id;
    plan.turn_id = response.request_id.empty() ? generate_id() : response.request_id;
    plan.reply_to = response.reply_to ? response.reply_to : context.replying_to;
    plan.interrupted_turn = context.interrupted_turn;
    plan.kind = (plan.reply_to || plan.interrupted_turn) ? TurnKind::Reply : TurnKind::Answer;
    plan.mode_policy = mode_for(context);
    plan.chunks = make_chunks(split_chunks(response.text, response.mode, split_config),
                              plan.reply_to);
    for (auto& chunk : plan.chunks) {
        chunk.estimated_delay_ms = static_cast<uint64_t>(delays.next_delay(chunk).count());
    }
    return plan;
}

} // namespace chatpace
