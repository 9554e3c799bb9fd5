#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "livelink/live/live_event.hpp"

namespace livelink::live {

struct BusMessage {
    std::string event_name;
    nlohmann::json payload;

    // Wire envelope: {"event": <event_name>, "payload": <payload>}
    std::string encode() const;
};

/**
 * Multi-producer fan-out channel. Each subscriber owns a bounded buffer; a
 * subscriber that falls behind loses its oldest messages rather than slowing
 * down publishers. Dropping the last reference to a Subscription detaches it.
 */
class EventBus {
public:
    class Subscription {
    public:
        explicit Subscription(std::size_t capacity);

        std::optional<BusMessage> next(std::chrono::milliseconds timeout);
        std::optional<BusMessage> try_next();
        std::size_t pending() const;
        std::size_t lagged() const;

    private:
        friend class EventBus;

        void deliver(const BusMessage& message);

        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<BusMessage> buffer_;
        std::size_t lagged_{0};
    };

    std::shared_ptr<Subscription> subscribe(std::size_t capacity = 256);

    // Returns the number of subscribers the message was delivered to.
    std::size_t publish(const std::string& event_name, nlohmann::json payload);
    std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
};

class EventQueue {
public:
    enum class PushResult { Pushed, Full, Closed };

    explicit EventQueue(std::size_t capacity = 256);

    PushResult try_push(LiveEvent event);
    std::optional<LiveEvent> pop(std::chrono::milliseconds timeout);
    std::optional<LiveEvent> try_pop();

    void close();
    bool closed() const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LiveEvent> queue_;
    bool closed_{false};
};

const char* to_string(EventQueue::PushResult result);

}  // namespace livelink::live
