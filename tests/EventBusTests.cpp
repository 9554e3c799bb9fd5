#include <catch2/catch_test_macros.hpp>

#include "livelink/live/event_bus.hpp"

#include <stdexcept>
#include <thread>

using namespace livelink::live;
using namespace std::chrono_literals;

namespace {

LiveEvent make_event(const std::string& cmd) {
    LiveEvent event;
    event.cmd = cmd;
    event.data = nlohmann::json{{"n", 1}};
    return event;
}

}  // namespace

TEST_CASE("bus delivers to every live subscription", "[bus]") {
    EventBus bus;
    auto first = bus.subscribe();
    auto second = bus.subscribe();

    REQUIRE(bus.publish("live.event", nlohmann::json{{"cmd", "X"}}) == 2);

    auto a = first->try_next();
    auto b = second->next(100ms);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a->event_name == "live.event");
    REQUIRE(b->payload["cmd"] == "X");
    REQUIRE_FALSE(first->try_next());
}

TEST_CASE("bus message envelope carries event and payload", "[bus]") {
    const BusMessage message{"live.started", nlohmann::json{{"active", true}}};
    const auto decoded = nlohmann::json::parse(message.encode());
    REQUIRE(decoded["event"] == "live.started");
    REQUIRE(decoded["payload"]["active"] == true);
}

TEST_CASE("slow subscriber loses its oldest messages", "[bus]") {
    EventBus bus;
    auto slow = bus.subscribe(2);

    for (int i = 0; i < 5; ++i) {
        bus.publish("tick", nlohmann::json(i));
    }

    REQUIRE(slow->pending() == 2);
    REQUIRE(slow->lagged() == 3);
    REQUIRE(slow->try_next()->payload == 3);
    REQUIRE(slow->try_next()->payload == 4);
}

TEST_CASE("dropping a subscription unsubscribes it", "[bus]") {
    EventBus bus;
    auto kept = bus.subscribe();
    {
        auto dropped = bus.subscribe();
        REQUIRE(bus.subscriber_count() == 2);
    }
    REQUIRE(bus.subscriber_count() == 1);
    REQUIRE(bus.publish("tick", nullptr) == 1);
}

TEST_CASE("publishing without subscribers is not an error", "[bus]") {
    EventBus bus;
    REQUIRE(bus.publish("tick", nullptr) == 0);
}

TEST_CASE("subscription next waits for a publisher on another thread", "[bus]") {
    EventBus bus;
    auto subscription = bus.subscribe();

    std::thread publisher([&bus] {
        std::this_thread::sleep_for(20ms);
        bus.publish("late", nullptr);
    });
    auto message = subscription->next(2s);
    publisher.join();

    REQUIRE(message);
    REQUIRE(message->event_name == "late");
    REQUIRE_FALSE(subscription->next(10ms));
}

TEST_CASE("event queue is bounded and reports why a push failed", "[queue]") {
    EventQueue queue(2);
    REQUIRE(queue.capacity() == 2);
    REQUIRE(queue.try_push(make_event("A")) == EventQueue::PushResult::Pushed);
    REQUIRE(queue.try_push(make_event("B")) == EventQueue::PushResult::Pushed);
    REQUIRE(queue.try_push(make_event("C")) == EventQueue::PushResult::Full);
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.pop(10ms)->cmd == "A");
    REQUIRE(queue.try_pop()->cmd == "B");
    REQUIRE_FALSE(queue.pop(10ms));

    queue.close();
    REQUIRE(queue.closed());
    REQUIRE(queue.try_push(make_event("D")) == EventQueue::PushResult::Closed);
    REQUIRE(std::string(to_string(EventQueue::PushResult::Full)) == "full");
}

TEST_CASE("closing the queue wakes a blocked consumer", "[queue]") {
    EventQueue queue;
    std::thread closer([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(queue.pop(5s));
    closer.join();
    REQUIRE(std::chrono::steady_clock::now() - start < 4s);
}

TEST_CASE("event queue rejects a zero capacity", "[queue]") {
    REQUIRE_THROWS_AS(EventQueue(0), std::invalid_argument);
}
