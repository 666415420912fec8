#pragma once
#include "chunk_source.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "interrupt.hpp"
#include "plan.hpp"
#include "scheduler.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chatpace {

// A streamed delivery: push deltas into `source`, then close() it.
struct StreamDelivery {
    SubmitResult result = SubmitResult::Rejected;
    std::string turn_id;
    std::shared_ptr<StreamChunkSource> source;
};

// Wires configuration, splitter, mode selection, scheduler and interrupt
// coordinator around one sink. Owns the event bus the scheduler and the
// coordinator talk over.
class DeliveryPipeline {
public:
    DeliveryPipeline(Sink& sink, Config config, SleepFn sleep = real_sleep());
    ~DeliveryPipeline();

    DeliveryPipeline(const DeliveryPipeline&) = delete;
    DeliveryPipeline& operator=(const DeliveryPipeline&) = delete;

    // Called for every user message once the coordinator has routed it
    void set_turn_handler(TurnHandler handler);

    DeliveryPlan build_plan(const RawResponse& response, const ChatContext& context);
    SubmitResult deliver(const RawResponse& response, const ChatContext& context);

    // Start a session fed by a stream; chunks are split and paced as the
    // deltas arrive. An empty turn_id gets a generated one.
    StreamDelivery deliver_stream(const ChatContext& context,
                                  std::string turn_id = {},
                                  std::optional<SplitMode> mode = std::nullopt);

    // New user message for a chat (publishes InterruptReceivedEvent)
    void interrupt(const InterruptEvent& event);

    // Context for answering `turn`: replies quote the user's message
    ChatContext context_for(const Turn& turn) const;

    const Config& config() const { return config_; }
    EventBus& bus() { return bus_; }
    DeliveryScheduler& scheduler() { return scheduler_; }
    InterruptCoordinator& coordinator() { return coordinator_; }

private:
    ChatContext resolve(const ChatContext& context) const;

    Config config_;
    EventBus bus_;
    DeliveryScheduler scheduler_;
    InterruptCoordinator coordinator_;
};

} // namespace chatpace
