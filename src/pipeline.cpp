#include "pipeline.hpp"
#include "util.hpp"

namespace chatpace {

DeliveryPipeline::DeliveryPipeline(Sink& sink, Config config, SleepFn sleep)
    : config_(std::move(config)),
      scheduler_(sink, config_.dispatch, config_.typing, std::move(sleep)),
      coordinator_(scheduler_)
{
    config_.validate();
    scheduler_.set_event_bus(&bus_);
    coordinator_.set_event_bus(&bus_);
    coordinator_.subscribe_events();
}

DeliveryPipeline::~DeliveryPipeline() {
    // Workers may still publish into the coordinator; stop them first
    scheduler_.shutdown();
}

void DeliveryPipeline::set_turn_handler(TurnHandler handler) {
    coordinator_.set_turn_handler(std::move(handler));
}

ChatContext DeliveryPipeline::resolve(const ChatContext& context) const {
    ChatContext resolved = context;
    if (resolved.reply_mode == ReplyMode::Auto) resolved.reply_mode = config_.reply_mode;
    return resolved;
}

DeliveryPlan DeliveryPipeline::build_plan(const RawResponse& response,
                                          const ChatContext& context) {
    DelayPolicy delays(config_.delay);
    return chatpace::build_plan(response, resolve(context), config_.split, delays);
}

SubmitResult DeliveryPipeline::deliver(const RawResponse& response,
                                       const ChatContext& context) {
    return scheduler_.submit(build_plan(response, context));
}

StreamDelivery DeliveryPipeline::deliver_stream(const ChatContext& context,
                                                std::string turn_id,
                                                std::optional<SplitMode> mode) {
    ChatContext ctx = resolve(context);

    DeliveryPlan header;
    header.chat_id = ctx.chat_id;
    header.turn_id = turn_id.empty() ? generate_id() : std::move(turn_id);
    header.reply_to = ctx.replying_to;
    header.interrupted_turn = ctx.interrupted_turn;
    header.kind = (header.reply_to || header.interrupted_turn) ? TurnKind::Reply
                                                               : TurnKind::Answer;
    header.mode_policy = mode_for(ctx);

    StreamDelivery delivery;
    delivery.turn_id = header.turn_id;
    delivery.source = std::make_shared<StreamChunkSource>(
        mode.value_or(config_.split.mode), config_.split, config_.delay, header.reply_to);
    delivery.result = scheduler_.submit(std::move(header), delivery.source);
    return delivery;
}

void DeliveryPipeline::interrupt(const InterruptEvent& event) {
    InterruptReceivedEvent ev;
    ev.interrupt = event;
    bus_.publish(ev);
}

ChatContext DeliveryPipeline::context_for(const Turn& turn) const {
    ChatContext ctx;
    ctx.chat_id = turn.message.chat_id;
    ctx.reply_mode = config_.reply_mode;
    ctx.interrupted_turn = turn.interrupted_turn;
    if (turn.kind == TurnKind::Reply) {
        ctx.replying_to = turn.message.message_id;
    } else {
        ctx.replying_to = turn.message.reply_to_message_id;
    }
    return ctx;
}

} // namespace chatpace
