#include "interrupt.hpp"
#include "scheduler.hpp"
#include <iostream>

namespace chatpace {

InterruptCoordinator::InterruptCoordinator(DeliveryScheduler& scheduler, TurnHandler handler)
    : scheduler_(scheduler), handler_(std::move(handler))
{}

void InterruptCoordinator::set_event_bus(EventBus* bus) {
    subscriptions_.bind(bus);
    event_bus_ = bus;
}

void InterruptCoordinator::subscribe_events() {
    if (!event_bus_ || !subscriptions_.empty()) return;

    subscriptions_.add(chatpace::subscribe<InterruptReceivedEvent>(*event_bus_,
        [this](const InterruptReceivedEvent& ev) {
            on_interrupt(ev.interrupt);
        }));

    subscriptions_.add(chatpace::subscribe<SessionFinishedEvent>(*event_bus_,
        [this](const SessionFinishedEvent& ev) {
            on_session_finished(ev.outcome);
        }));
}

void InterruptCoordinator::on_interrupt(const InterruptEvent& event) {
    enum class Route { Answer, Reply, Queue };
    Route route = Route::Answer;
    std::optional<std::string> interrupted;
    size_t pending = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto queued = pending_.find(event.chat_id);
        bool behind_queue = (queued != pending_.end() && !queued->second.empty()) ||
                            draining_.count(event.chat_id) > 0;
        auto active = scheduler_.active_session(event.chat_id);

        if (behind_queue) {
            route = Route::Queue;
        } else if (active && active->policy == ModePolicy::ReplySafe) {
            route = Route::Reply;
            interrupted = active->turn_id;
            scheduler_.request_cancel(event.chat_id);
        } else if (active) {
            route = Route::Queue;
        }

        if (route == Route::Queue) {
            auto& queue = pending_[event.chat_id];
            queue.push_back(event);
            pending = queue.size();
        }
    }

    switch (route) {
        case Route::Queue:
            std::cerr << "[interrupt] chat " << event.chat_id << ": message "
                      << event.message_id << " deferred (" << pending << " pending)\n";
            if (event_bus_) {
                TurnDeferredEvent ev;
                ev.chat_id = event.chat_id;
                ev.message_id = event.message_id;
                ev.pending = pending;
                event_bus_->publish(ev);
            }
            // The session may have ended between the check and the push
            drain(event.chat_id);
            return;
        case Route::Reply: {
            std::cerr << "[interrupt] chat " << event.chat_id << ": cancelling turn "
                      << *interrupted << ", replying to message " << event.message_id << '\n';
            Turn turn;
            turn.message = event;
            turn.kind = TurnKind::Reply;
            turn.interrupted_turn = interrupted;
            handle(turn);
            return;
        }
        case Route::Answer: {
            Turn turn;
            turn.message = event;
            handle(turn);
            return;
        }
    }
}

void InterruptCoordinator::on_session_finished(const DeliveryOutcome& outcome) {
    drain(outcome.chat_id);
}

void InterruptCoordinator::drain(const std::string& chat_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (draining_.count(chat_id) > 0) return;
        draining_.insert(chat_id);
    }

    while (true) {
        Turn turn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(chat_id);
            if (it == pending_.end() || it->second.empty() || scheduler_.is_active(chat_id)) {
                if (it != pending_.end() && it->second.empty()) pending_.erase(it);
                draining_.erase(chat_id);
                return;
            }
            turn.message = std::move(it->second.front());
            it->second.pop_front();
        }
        handle(turn);
    }
}

void InterruptCoordinator::handle(const Turn& turn) {
    if (!handler_) {
        std::cerr << "[interrupt] chat " << turn.message.chat_id
                  << ": no turn handler, message " << turn.message.message_id
                  << " dropped\n";
        return;
    }
    try {
        handler_(turn);
    } catch (const std::exception& e) {
        std::cerr << "[interrupt] chat " << turn.message.chat_id
                  << ": turn handler failed for message " << turn.message.message_id
                  << ": " << e.what() << '\n';
    }
}

size_t InterruptCoordinator::pending_count(const std::string& chat_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(chat_id);
    return it == pending_.end() ? 0 : it->second.size();
}

} // namespace chatpace
