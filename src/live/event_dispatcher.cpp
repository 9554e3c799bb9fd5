#include "livelink/live/event_dispatcher.hpp"

#include "livelink/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace livelink::live {

namespace {

std::string preview(std::span<const std::uint8_t> chunk) {
    constexpr std::size_t kMaxPreview = 256;
    const auto length = std::min(chunk.size(), kMaxPreview);
    std::string text(reinterpret_cast<const char*>(chunk.data()), length);
    if (chunk.size() > kMaxPreview) {
        text += "...";
    }
    return text;
}

}  // namespace

EventDispatcher::EventDispatcher(std::shared_ptr<EventBus> bus, std::shared_ptr<EventQueue> queue)
    : bus_(std::move(bus)), queue_(std::move(queue)) {}

std::size_t EventDispatcher::dispatch_payload(std::span<const std::uint8_t> payload) {
    std::vector<protocol::Frame> frames;
    try {
        frames = protocol::decode(payload, limits_);
    } catch (const ProtocolError& ex) {
        spdlog::warn("Dropping malformed live message ({} bytes): {}", payload.size(), ex.what());
        return 0;
    }

    std::size_t published = 0;
    for (const auto& frame : frames) {
        published += dispatch(frame);
    }
    return published;
}

std::size_t EventDispatcher::dispatch(const protocol::Frame& frame) {
    switch (static_cast<protocol::Operation>(frame.operation)) {
    case protocol::Operation::AuthReply:
        spdlog::info("Live push authenticated (len={}, version={}, seq={}): {}",
                     frame.total_len,
                     frame.version,
                     frame.sequence,
                     preview(frame.body));
        return 0;
    case protocol::Operation::HeartbeatReply:
        spdlog::debug("Live heartbeat reply (len={}, seq={})", frame.total_len, frame.sequence);
        return 0;
    case protocol::Operation::SendEvent: {
        spdlog::debug("Parsing live event frame (len={}, version={}, seq={})",
                      frame.total_len,
                      frame.version,
                      frame.sequence);
        auto events = parse_events(frame);
        const auto count = events.size();
        for (auto& event : events) {
            publish(std::move(event));
        }
        return count;
    }
    default:
        spdlog::debug("Ignoring live frame with operation {} ({}), {} body bytes",
                      frame.operation,
                      protocol::operation_name(frame.operation),
                      frame.body.size());
        return 0;
    }
}

std::vector<LiveEvent> EventDispatcher::parse_events(const protocol::Frame& frame) {
    std::vector<LiveEvent> events;
    const std::span<const std::uint8_t> body(frame.body);

    std::size_t begin = 0;
    while (begin <= body.size()) {
        const auto it = std::find(body.begin() + static_cast<std::ptrdiff_t>(begin), body.end(), std::uint8_t{0});
        const auto end = static_cast<std::size_t>(it - body.begin());
        const auto chunk = body.subspan(begin, end - begin);
        begin = end + 1;
        if (chunk.empty()) {
            continue;
        }

        try {
            auto document = nlohmann::json::parse(chunk.begin(), chunk.end());
            auto cmd = document.find("cmd");
            if (!document.is_object() || cmd == document.end() || !cmd->is_string()) {
                spdlog::warn("Live event without a cmd field: {}", preview(chunk));
                continue;
            }
            LiveEvent event;
            event.cmd = cmd->get<std::string>();
            if (auto data = document.find("data"); data != document.end()) {
                event.data = std::move(*data);
            }
            events.push_back(std::move(event));
        } catch (const nlohmann::json::exception& ex) {
            spdlog::warn("Failed to parse live event JSON ({}): {}", ex.what(), preview(chunk));
        }
    }
    return events;
}

void EventDispatcher::publish(LiveEvent event) {
    if (bus_) {
        bus_->publish(kLiveEventName, event.to_json());
    }
    if (queue_) {
        const auto cmd = event.cmd;
        const auto result = queue_->try_push(std::move(event));
        if (result != EventQueue::PushResult::Pushed) {
            spdlog::warn("Live event {} not queued: consumer queue {}", cmd, to_string(result));
        }
    }
}

}  // namespace livelink::live
