#pragma once
#include "chunk_source.hpp"
#include "plan.hpp"
#include "session.hpp"
#include "sink.hpp"
#include "typing.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chatpace {

class EventBus;

struct SchedulerConfig {
    uint32_t retry_count = 3;          // retries after the first attempt
    uint32_t retry_backoff_ms = 250;   // doubled per retry
    uint32_t dispatch_timeout_ms = 0;  // 0 = no timeout
};

// Wait before retry number `retry` (1-based): base << (retry - 1),
// saturated at UINT32_MAX ms
uint64_t retry_backoff_ms(uint32_t base_ms, uint64_t retry);

// Snapshot of a chat's running session
struct ActiveSession {
    std::string turn_id;
    ModePolicy policy = ModePolicy::AnswerSafe;
    SessionStatus status = SessionStatus::Pending;
    size_t delivered_count = 0;
    bool cancel_requested = false;
};

enum class SubmitResult {
    Started,       // session running
    Superseding,   // active ReplySafe session asked to cancel; starts after it
    Rejected,      // active AnswerSafe session for the chat
    ShuttingDown
};

const char* submit_result_name(SubmitResult result);

// Runs delivery sessions, one worker thread each, and owns the chat-keyed
// session registry: at most one active session per chat.
//
// Per chunk: check cancellation, idle, show typing, wait the chunk delay,
// dispatch (retrying transient failures with exponential backoff), hide
// typing. Cancellation is honoured only before a chunk starts.
//
// A dispatch is never abandoned: an attempt that overruns
// dispatch_timeout_ms is waited for, kept if the sink acked it, and
// otherwise retried as transient. Chunks of a session therefore never
// overlap in the sink.
//
// The sink must outlive the scheduler; the destructor cancels every
// session and joins the workers.
class DeliveryScheduler {
public:
    DeliveryScheduler(Sink& sink, SchedulerConfig config, TypingConfig typing,
                      SleepFn sleep = real_sleep());
    ~DeliveryScheduler();

    DeliveryScheduler(const DeliveryScheduler&) = delete;
    DeliveryScheduler& operator=(const DeliveryScheduler&) = delete;

    // Optional event bus for session lifecycle events
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    SubmitResult submit(DeliveryPlan plan);

    // Streamed session: `header` supplies chat, turn and policy; its chunks
    // are ignored in favour of `source`.
    SubmitResult submit(DeliveryPlan header, std::shared_ptr<ChunkSource> source);

    // Ask the chat's active session to stop before its next chunk. Returns
    // true only for the call that actually raised the request.
    bool request_cancel(const std::string& chat_id);

    bool is_active(const std::string& chat_id) const;
    std::optional<ActiveSession> active_session(const std::string& chat_id) const;
    std::optional<SessionStatus> status(const std::string& chat_id) const;
    std::optional<DeliveryOutcome> last_outcome(const std::string& chat_id) const;
    size_t active_count() const;

    // Block until no session is running
    void wait_idle();
    bool wait_idle_for(std::chrono::milliseconds timeout);

    // Reject new work, cancel everything, wait for workers
    void shutdown();

private:
    struct Session {
        DeliveryPlan header;
        std::shared_ptr<ChunkSource> source;
        std::atomic<bool> cancel_requested{false};
        std::atomic<SessionStatus> status{SessionStatus::Pending};
        std::atomic<size_t> cursor{0};
        uint64_t started_at = 0;
    };

    struct Entry {
        std::shared_ptr<Session> active;
        std::shared_ptr<Session> successor;
    };

    bool raise_cancel(Session& session);
    void run(std::string chat_id, std::shared_ptr<Session> session);
    DeliveryOutcome execute(Session& session);
    DispatchResult dispatch_with_retry(const std::string& chat_id, const MessageChunk& chunk);
    DispatchResult dispatch_with_timeout(const std::string& chat_id, const MessageChunk& chunk);
    void finish(const DeliveryOutcome& outcome);
    void join_exited();
    DeliveryOutcome dropped_outcome(const Session& session) const;

    Sink& sink_;
    SchedulerConfig config_;
    TypingIndicatorController typing_;
    SleepFn sleep_;
    EventBus* event_bus_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, Entry> registry_;
    std::unordered_map<std::string, DeliveryOutcome> last_outcomes_;
    std::unordered_map<std::thread::id, std::thread> workers_;
    std::vector<std::thread> exited_;  // returned from run(), not yet joined
    bool shutting_down_ = false;
};

} // namespace chatpace
