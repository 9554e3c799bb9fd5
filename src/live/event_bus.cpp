#include "livelink/live/event_bus.hpp"

#include <algorithm>
#include <stdexcept>

namespace livelink::live {

std::string BusMessage::encode() const {
    return nlohmann::json{{"event", event_name}, {"payload", payload}}.dump();
}

EventBus::Subscription::Subscription(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::optional<BusMessage> EventBus::Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !buffer_.empty(); })) {
        return std::nullopt;
    }
    BusMessage message = std::move(buffer_.front());
    buffer_.pop_front();
    return message;
}

std::optional<BusMessage> EventBus::Subscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.empty()) {
        return std::nullopt;
    }
    BusMessage message = std::move(buffer_.front());
    buffer_.pop_front();
    return message;
}

std::size_t EventBus::Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::size_t EventBus::Subscription::lagged() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lagged_;
}

void EventBus::Subscription::deliver(const BusMessage& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer_.size() >= capacity_) {
            buffer_.pop_front();
            ++lagged_;
        }
        buffer_.push_back(message);
    }
    cv_.notify_one();
}

std::shared_ptr<EventBus::Subscription> EventBus::subscribe(std::size_t capacity) {
    auto subscription = std::make_shared<Subscription>(capacity);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

std::size_t EventBus::publish(const std::string& event_name, nlohmann::json payload) {
    const BusMessage message{event_name, std::move(payload)};

    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.erase(std::remove_if(subscribers_.begin(),
                                          subscribers_.end(),
                                          [](const auto& weak) { return weak.expired(); }),
                           subscribers_.end());
        targets.reserve(subscribers_.size());
        for (const auto& weak : subscribers_) {
            if (auto subscription = weak.lock()) {
                targets.push_back(std::move(subscription));
            }
        }
    }

    for (const auto& subscription : targets) {
        subscription->deliver(message);
    }
    return targets.size();
}

std::size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        subscribers_.begin(), subscribers_.end(), [](const auto& weak) { return !weak.expired(); }));
}

EventQueue::EventQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("EventQueue capacity must be positive");
    }
}

EventQueue::PushResult EventQueue::try_push(LiveEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return PushResult::Closed;
        }
        if (queue_.size() >= capacity_) {
            return PushResult::Full;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return PushResult::Pushed;
}

std::optional<LiveEvent> EventQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    LiveEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<LiveEvent> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    LiveEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

const char* to_string(EventQueue::PushResult result) {
    switch (result) {
    case EventQueue::PushResult::Pushed:
        return "pushed";
    case EventQueue::PushResult::Full:
        return "full";
    case EventQueue::PushResult::Closed:
        return "closed";
    }
    return "unknown";
}

}  // namespace livelink::live
