#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "livelink/live/event_bus.hpp"
#include "livelink/live/live_event.hpp"
#include "livelink/protocol/packet_codec.hpp"

namespace livelink::live {

class EventDispatcher {
public:
    // Either sink may be null; events are then only parsed and logged.
    EventDispatcher(std::shared_ptr<EventBus> bus, std::shared_ptr<EventQueue> queue);

    // Decodes one socket message and dispatches every frame in it. A
    // ProtocolError drops the message with a warning and returns 0.
    std::size_t dispatch_payload(std::span<const std::uint8_t> payload);

    // Returns the number of LiveEvents published for this frame.
    std::size_t dispatch(const protocol::Frame& frame);

    // Splits a SEND_EVENT body on zero bytes and parses every non-empty chunk.
    static std::vector<LiveEvent> parse_events(const protocol::Frame& frame);

private:
    void publish(LiveEvent event);

    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<EventQueue> queue_;
    protocol::DecodeLimits limits_{};
};

}  // namespace livelink::live
