#include "livelink/live/session_info.hpp"

#include "livelink/util/time.hpp"

#include <algorithm>

namespace livelink::live {

nlohmann::json session_payload(const SessionInfo& info, std::chrono::system_clock::time_point now) {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - info.started_at).count();
    nlohmann::json payload = {
        {"active", true},
        {"game_id", info.session_id},
        {"room_id", info.room_id},
        {"anchor_name", info.anchor_name},
        {"anchor_open_id", nullptr},
        {"started_at", util::beijing_with_offset(info.started_at)},
        {"uptime_seconds", std::max<std::int64_t>(uptime, 0)},
    };
    if (info.anchor_id) {
        payload["anchor_open_id"] = *info.anchor_id;
    }
    return payload;
}

nlohmann::json inactive_payload() {
    return nlohmann::json{{"active", false}};
}

}  // namespace livelink::live
