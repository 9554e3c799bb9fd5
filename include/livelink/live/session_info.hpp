#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace livelink::live {

struct SessionInfo {
    std::string session_id;
    std::int64_t room_id{0};
    std::string anchor_name;
    std::optional<std::string> anchor_id;
    std::chrono::system_clock::time_point started_at{};
};

/**
 * Status document used for live.started / live.stopped / live.status
 * announcements. `uptime_seconds` is measured against `now` and never negative.
 */
nlohmann::json session_payload(const SessionInfo& info,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

nlohmann::json inactive_payload();

}  // namespace livelink::live
