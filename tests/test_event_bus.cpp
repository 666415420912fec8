#include <catch2/catch_test_macros.hpp>
#include "event_bus.hpp"

using namespace chatpace;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(InterruptReceivedEvent::TAG, [&](const Event&) {
        count++;
    });

    InterruptReceivedEvent ev;
    ev.interrupt.chat_id = "c1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(SessionFinishedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(SessionFinishedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    SessionFinishedEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    ChunkDeliveredEvent ev;
    bus.publish(ev); // should not crash
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int started = 0;
    int finished = 0;

    bus.subscribe(SessionStartedEvent::TAG, [&](const Event&) { started++; });
    bus.subscribe(SessionFinishedEvent::TAG, [&](const Event&) { finished++; });

    SessionStartedEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);

    SessionFinishedEvent ev2;
    bus.publish(ev2);

    REQUIRE(started == 2);
    REQUIRE(finished == 1);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t id = bus.subscribe(TurnDeferredEvent::TAG, [&](const Event&) {
        count++;
    });

    TurnDeferredEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1); // not called again
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

TEST_CASE("EventBus: handler may unsubscribe itself while publishing", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = 0;
    id = bus.subscribe(ChunkDeliveredEvent::TAG, [&](const Event&) {
        count++;
        bus.unsubscribe(id);
    });

    ChunkDeliveredEvent ev;
    bus.publish(ev);
    bus.publish(ev);

    REQUIRE(count == 1);
}

// ── Clear / subscriber_count ────────────────────────────────────

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(SessionStartedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe(SessionFinishedEvent::TAG, [&](const Event&) { count++; });

    bus.clear();

    SessionStartedEvent ev1;
    SessionFinishedEvent ev2;
    bus.publish(ev1);
    bus.publish(ev2);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: subscriber_count", "[event_bus]") {
    EventBus bus;
    REQUIRE(bus.subscriber_count(InterruptReceivedEvent::TAG) == 0);

    bus.subscribe(InterruptReceivedEvent::TAG, [](const Event&) {});
    bus.subscribe(InterruptReceivedEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(InterruptReceivedEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(SessionStartedEvent::TAG) == 0);
}

// ── Type-safe subscribe helper ──────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe carries event data", "[event_bus]") {
    EventBus bus;
    DeliveryOutcome captured;

    subscribe<SessionFinishedEvent>(bus, [&](const SessionFinishedEvent& ev) {
        captured = ev.outcome;
    });

    SessionFinishedEvent ev;
    ev.outcome.chat_id = "c1";
    ev.outcome.turn_id = "t1";
    ev.outcome.status = SessionStatus::Cancelled;
    ev.outcome.delivered_count = 2;
    bus.publish(ev);

    REQUIRE(captured.chat_id == "c1");
    REQUIRE(captured.turn_id == "t1");
    REQUIRE(captured.status == SessionStatus::Cancelled);
    REQUIRE(captured.delivered_count == 2);
}

// ── SubscriptionSet ─────────────────────────────────────────────

TEST_CASE("SubscriptionSet: unsubscribes on destruction", "[event_bus]") {
    EventBus bus;
    {
        SubscriptionSet subs(&bus);
        subs.add(bus.subscribe(SessionStartedEvent::TAG, [](const Event&) {}));
        subs.add(subscribe<SessionFinishedEvent>(bus, [](const SessionFinishedEvent&) {}));
        REQUIRE_FALSE(subs.empty());
        REQUIRE(bus.subscriber_count(SessionStartedEvent::TAG) == 1);
    }
    REQUIRE(bus.subscriber_count(SessionStartedEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count(SessionFinishedEvent::TAG) == 0);
}

TEST_CASE("SubscriptionSet: rebinding drops the old subscriptions", "[event_bus]") {
    EventBus first;
    EventBus second;
    SubscriptionSet subs(&first);
    subs.add(first.subscribe(TurnDeferredEvent::TAG, [](const Event&) {}));

    subs.bind(&second);

    REQUIRE(subs.empty());
    REQUIRE(first.subscriber_count(TurnDeferredEvent::TAG) == 0);
}
