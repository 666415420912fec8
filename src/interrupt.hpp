#pragma once
#include "event.hpp"
#include "event_bus.hpp"
#include "plan.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace chatpace {

class DeliveryScheduler;

// A user message that needs a response.
struct Turn {
    InterruptEvent message;
    TurnKind kind = TurnKind::Answer;
    std::optional<std::string> interrupted_turn;   // set for Reply turns
};

// Produces and delivers the response to a turn (typically: ask the model,
// then DeliveryPipeline::deliver). Called without any coordinator lock held.
using TurnHandler = std::function<void(const Turn&)>;

// Routes user messages that arrive while a delivery may be running.
//   idle chat            -> handler gets an Answer turn right away
//   ReplySafe delivery   -> delivery is asked to cancel, handler gets a
//                           Reply turn referencing the interrupted turn
//   AnswerSafe delivery  -> message is queued; queued messages become
//                           Answer turns, in order, once the chat is idle
// Every message is applied or queued exactly once.
class InterruptCoordinator {
public:
    explicit InterruptCoordinator(DeliveryScheduler& scheduler, TurnHandler handler = {});

    void set_turn_handler(TurnHandler handler) { handler_ = std::move(handler); }

    // Optional event bus: subscribe_events() listens for interrupts and
    // finished sessions; deferrals are published as TurnDeferredEvent.
    void set_event_bus(EventBus* bus);
    void subscribe_events();

    void on_interrupt(const InterruptEvent& event);
    void on_session_finished(const DeliveryOutcome& outcome);

    size_t pending_count(const std::string& chat_id) const;

private:
    void drain(const std::string& chat_id);
    void handle(const Turn& turn);

    DeliveryScheduler& scheduler_;
    TurnHandler handler_;
    EventBus* event_bus_ = nullptr;
    SubscriptionSet subscriptions_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<InterruptEvent>> pending_;
    std::unordered_set<std::string> draining_;
};

} // namespace chatpace
