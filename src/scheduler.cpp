#include "scheduler.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace chatpace {

const char* submit_result_name(SubmitResult result) {
    switch (result) {
        case SubmitResult::Started: return "started";
        case SubmitResult::Superseding: return "superseding";
        case SubmitResult::Rejected: return "rejected";
        case SubmitResult::ShuttingDown: return "shutting_down";
    }
    return "rejected";
}

uint64_t retry_backoff_ms(uint32_t base_ms, uint64_t retry) {
    if (retry == 0 || base_ms == 0) return 0;
    const uint64_t shift = std::min<uint64_t>(retry - 1, 32);
    return std::min<uint64_t>(static_cast<uint64_t>(base_ms) << shift, UINT32_MAX);
}

DeliveryScheduler::DeliveryScheduler(Sink& sink, SchedulerConfig config,
                                     TypingConfig typing, SleepFn sleep)
    : sink_(sink), config_(config),
      typing_(sink, typing, sleep), sleep_(std::move(sleep))
{}

DeliveryScheduler::~DeliveryScheduler() {
    shutdown();
}

// ── Registry ────────────────────────────────────────────────────

SubmitResult DeliveryScheduler::submit(DeliveryPlan plan) {
    auto source = std::make_shared<PlanChunkSource>(std::move(plan.chunks));
    plan.chunks.clear();
    return submit(std::move(plan), std::move(source));
}

SubmitResult DeliveryScheduler::submit(DeliveryPlan header, std::shared_ptr<ChunkSource> source) {
    auto session = std::make_shared<Session>();
    session->header = std::move(header);
    session->header.chunks.clear();
    session->source = std::move(source);
    const std::string chat_id = session->header.chat_id;

    join_exited();

    std::shared_ptr<Session> dropped;
    SubmitResult result = SubmitResult::Rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return SubmitResult::ShuttingDown;

        auto it = registry_.find(chat_id);
        if (it == registry_.end()) {
            // Started under the lock so the worker cannot retire before
            // its handle is registered
            std::thread worker(&DeliveryScheduler::run, this, chat_id, session);
            registry_[chat_id].active = session;
            workers_.emplace(worker.get_id(), std::move(worker));
            result = SubmitResult::Started;
        } else if (it->second.active->header.mode_policy == ModePolicy::ReplySafe) {
            raise_cancel(*it->second.active);
            dropped = std::move(it->second.successor);
            it->second.successor = session;
            result = SubmitResult::Superseding;
        }
    }

    if (dropped) finish(dropped_outcome(*dropped));

    if (result == SubmitResult::Rejected) {
        std::cerr << "[scheduler] chat " << chat_id
                  << ": delivery already active, turn " << session->header.turn_id
                  << " rejected\n";
    }
    return result;
}

bool DeliveryScheduler::raise_cancel(Session& session) {
    bool expected = false;
    if (!session.cancel_requested.compare_exchange_strong(expected, true)) return false;
    session.source->interrupt();
    return true;
}

bool DeliveryScheduler::request_cancel(const std::string& chat_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(chat_id);
    if (it == registry_.end()) return false;
    return raise_cancel(*it->second.active);
}

bool DeliveryScheduler::is_active(const std::string& chat_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.count(chat_id) > 0;
}

std::optional<ActiveSession> DeliveryScheduler::active_session(const std::string& chat_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(chat_id);
    if (it == registry_.end()) return std::nullopt;
    const Session& session = *it->second.active;
    ActiveSession info;
    info.turn_id = session.header.turn_id;
    info.policy = session.header.mode_policy;
    info.status = session.status.load();
    info.delivered_count = session.cursor.load();
    info.cancel_requested = session.cancel_requested.load();
    return info;
}

std::optional<SessionStatus> DeliveryScheduler::status(const std::string& chat_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(chat_id);
    if (it == registry_.end()) return std::nullopt;
    return it->second.active->status.load();
}

std::optional<DeliveryOutcome> DeliveryScheduler::last_outcome(const std::string& chat_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_outcomes_.find(chat_id);
    if (it == last_outcomes_.end()) return std::nullopt;
    return it->second;
}

size_t DeliveryScheduler::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.size();
}

void DeliveryScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return workers_.empty() && registry_.empty(); });
}

bool DeliveryScheduler::wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return workers_.empty() && registry_.empty(); });
}

void DeliveryScheduler::shutdown() {
    std::vector<std::shared_ptr<Session>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (auto& [chat_id, entry] : registry_) {
            raise_cancel(*entry.active);
            if (entry.successor) dropped.push_back(std::move(entry.successor));
        }
    }
    for (const auto& session : dropped) finish(dropped_outcome(*session));

    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return workers_.empty() && registry_.empty(); });
    }
    join_exited();
}

void DeliveryScheduler::join_exited() {
    std::vector<std::thread> exited;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        exited.swap(exited_);
    }
    for (auto& worker : exited) worker.join();
}

// ── Session worker ──────────────────────────────────────────────

void DeliveryScheduler::run(std::string chat_id, std::shared_ptr<Session> session) {
    while (session) {
        session->started_at = epoch_millis();
        if (event_bus_) {
            SessionStartedEvent ev;
            ev.chat_id = chat_id;
            ev.turn_id = session->header.turn_id;
            ev.kind = session->header.kind;
            ev.policy = session->header.mode_policy;
            event_bus_->publish(ev);
        }

        DeliveryOutcome outcome = execute(*session);

        std::shared_ptr<Session> next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = registry_.find(chat_id);
            if (it != registry_.end()) {
                next = std::move(it->second.successor);
                if (next) {
                    it->second.active = next;
                } else {
                    registry_.erase(it);
                }
            }
        }
        finish(outcome);
        session = std::move(next);
    }

    // Hand our own handle to join_exited(); nothing below touches shared state
    std::lock_guard<std::mutex> lock(mutex_);
    auto self = workers_.find(std::this_thread::get_id());
    if (self != workers_.end()) {
        exited_.push_back(std::move(self->second));
        workers_.erase(self);
    }
    idle_cv_.notify_all();
}

DeliveryOutcome DeliveryScheduler::execute(Session& session) {
    const std::string& chat_id = session.header.chat_id;
    DeliveryOutcome outcome;
    outcome.chat_id = chat_id;
    outcome.turn_id = session.header.turn_id;
    outcome.started_at = session.started_at;

    auto settle = [&](SessionStatus status) {
        session.status.store(status);
        outcome.status = status;
        outcome.delivered_count = session.cursor.load();
        outcome.finished_at = epoch_millis();
        return outcome;
    };

    while (auto chunk = session.source->next()) {
        // 1. Chunk boundary: the only point where cancellation is honoured
        if (session.cancel_requested.load()) {
            std::cerr << "[scheduler] chat " << chat_id << ": cancelled after "
                      << session.cursor.load() << " chunk(s)\n";
            return settle(SessionStatus::Cancelled);
        }

        // 2. Natural pause, then "typing..." for the chunk's delay
        typing_.idle();
        session.status.store(SessionStatus::TypingShown);
        typing_.show(chat_id);
        sleep_(std::chrono::milliseconds(chunk->estimated_delay_ms));

        // 3-4. Dispatch, retrying transient failures
        session.status.store(SessionStatus::Sending);
        DispatchResult result = dispatch_with_retry(chat_id, *chunk);
        typing_.hide(chat_id);

        if (!result.ok()) {
            outcome.failure = result.status == DispatchStatus::Permanent
                ? DispatchErrorKind::Permanent : DispatchErrorKind::Transient;
            outcome.error = result.error;
            std::cerr << "[scheduler] chat " << chat_id << ": delivery failed at chunk "
                      << chunk->index << " (" << dispatch_error_kind_name(*outcome.failure)
                      << "): " << result.error << '\n';
            return settle(SessionStatus::Failed);
        }

        // 5. Advance
        session.cursor.fetch_add(1);
        if (event_bus_) {
            ChunkDeliveredEvent ev;
            ev.chat_id = chat_id;
            ev.turn_id = session.header.turn_id;
            ev.index = chunk->index;
            event_bus_->publish(ev);
        }
    }

    // A source that stopped early was interrupted by a cancel request
    if (!session.source->exhausted()) return settle(SessionStatus::Cancelled);
    return settle(SessionStatus::Completed);
}

DispatchResult DeliveryScheduler::dispatch_with_retry(const std::string& chat_id,
                                                      const MessageChunk& chunk) {
    const uint64_t attempts = static_cast<uint64_t>(config_.retry_count) + 1;
    DispatchResult result;
    for (uint64_t attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            sleep_(std::chrono::milliseconds(retry_backoff_ms(config_.retry_backoff_ms, attempt)));
        }
        result = dispatch_with_timeout(chat_id, chunk);
        if (result.ok() || result.status == DispatchStatus::Permanent) return result;

        std::cerr << "[scheduler] " << sink_.sink_name() << " chat " << chat_id
                  << " chunk " << chunk.index << " attempt " << (attempt + 1) << "/"
                  << attempts << " failed: " << result.error << '\n';
    }
    result.error = "retries exhausted after " + std::to_string(attempts) +
                   " attempt(s): " + result.error;
    return result;
}

DispatchResult DeliveryScheduler::dispatch_with_timeout(const std::string& chat_id,
                                                        const MessageChunk& chunk) {
    if (config_.dispatch_timeout_ms == 0) return dispatch_once(sink_, chat_id, chunk);

    const auto started = std::chrono::steady_clock::now();
    DispatchResult result = dispatch_once(sink_, chat_id, chunk);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed.count() <= static_cast<long long>(config_.dispatch_timeout_ms)) return result;

    std::cerr << "[scheduler] " << sink_.sink_name() << " chat " << chat_id
              << " chunk " << chunk.index << " took " << elapsed.count()
              << "ms (timeout " << config_.dispatch_timeout_ms << "ms)\n";
    // A late ack is still a delivery; resending would duplicate the chunk
    if (result.ok()) return result;
    return DispatchResult::transient("dispatch timed out after " +
                                     std::to_string(config_.dispatch_timeout_ms) +
                                     "ms: " + result.error);
}

// ── Outcomes ────────────────────────────────────────────────────

DeliveryOutcome DeliveryScheduler::dropped_outcome(const Session& session) const {
    DeliveryOutcome outcome;
    outcome.chat_id = session.header.chat_id;
    outcome.turn_id = session.header.turn_id;
    outcome.status = SessionStatus::Cancelled;
    outcome.finished_at = epoch_millis();
    return outcome;
}

void DeliveryScheduler::finish(const DeliveryOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_outcomes_[outcome.chat_id] = outcome;
    }
    if (event_bus_) {
        SessionFinishedEvent ev;
        ev.outcome = outcome;
        event_bus_->publish(ev);
    }
}

} // namespace chatpace
