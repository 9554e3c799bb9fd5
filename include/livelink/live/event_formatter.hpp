#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "livelink/live/live_event.hpp"

namespace livelink::live {

struct FormattedEvent {
    std::string headline;
    std::vector<std::string> details;

    // Headline, followed by an indented detail line when there are details.
    std::string to_string() const;
};

// Console rendering of the known LIVE_OPEN_PLATFORM_* commands. Unknown commands yield nullopt.
std::optional<FormattedEvent> format_event(const LiveEvent& event);

std::string format_timestamp(std::optional<std::int64_t> unix_seconds);
std::string format_currency(std::int64_t milli_units);
std::string guard_level_label(std::int64_t level);

}  // namespace livelink::live
