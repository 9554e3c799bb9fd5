#include "livelink/live/event_formatter.hpp"

#include "livelink/util/time.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace livelink::live {

namespace {

constexpr const char* kAnonymous = "anonymous";

std::string trim(const std::string& value) {
    auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::string name_or_anonymous(std::optional<std::string> name) {
    if (!name || name->empty()) {
        return kAnonymous;
    }
    return *name;
}

void push_detail(std::vector<std::string>& details, const char* label, const std::optional<std::string>& value) {
    if (value && !trim(*value).empty()) {
        details.push_back(fmt::format("{}: {}", label, *value));
    }
}

void push_detail(std::vector<std::string>& details, const char* label, const std::optional<std::int64_t>& value) {
    if (value) {
        details.push_back(fmt::format("{}: {}", label, *value));
    }
}

void push_medal(std::vector<std::string>& details, const LiveEvent& event) {
    const auto name = event.field_str({"fans_medal_name"});
    if (!name) {
        return;
    }
    const auto trimmed = trim(*name);
    if (trimmed.empty()) {
        return;
    }
    const auto level = event.field_i64({"fans_medal_level"});
    if (level && *level > 0) {
        details.push_back(fmt::format("medal: {} Lv{}", trimmed, *level));
    } else {
        details.push_back(fmt::format("medal: {}", trimmed));
    }
}

void push_guard(std::vector<std::string>& details, const LiveEvent& event) {
    const auto level = event.field_i64({"guard_level"});
    if (level && *level > 0) {
        details.push_back(fmt::format("guard: {}", guard_level_label(*level)));
    }
}

FormattedEvent format_dm(const LiveEvent& event) {
    FormattedEvent out;
    auto name = name_or_anonymous(event.field_str({"uname"}));
    if (event.field_bool({"is_admin"}).value_or(false)) {
        name = "[admin] " + name;
    }
    out.headline = fmt::format("[{}] {}: {}",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name,
                               event.field_str({"msg"}).value_or("<empty>"));

    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_guard(out.details, event);
    push_medal(out.details, event);
    if (const auto wearing = event.field_bool({"fans_medal_wearing_status"})) {
        out.details.push_back(fmt::format("wearing medal: {}", *wearing ? "yes" : "no"));
    }
    if (const auto reply = event.field_str({"reply_uname"}); reply && !reply->empty()) {
        out.details.push_back("reply to: " + *reply);
    }
    if (event.field_i64({"dm_type"}).value_or(0) == 1) {
        const auto url = event.field_str({"emoji_img_url"});
        out.details.push_back(url && !url->empty() ? "emoji: " + *url : std::string("emoji message"));
    }
    push_detail(out.details, "msg_id", event.field_str({"msg_id"}));
    return out;
}

FormattedEvent format_gift(const LiveEvent& event) {
    FormattedEvent out;
    const auto count = std::max<std::int64_t>(event.field_i64({"gift_num"}).value_or(1), 1);
    auto gift = event.field_str({"gift_name"});
    out.headline = fmt::format("[{}] {} sent {} x{}",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name_or_anonymous(event.field_str({"uname"})),
                               gift && !gift->empty() ? *gift : std::string("gift"),
                               count);

    const auto price = event.field_i64({"price"}).value_or(0);
    auto total = event.field_i64({"r_price"}).value_or(0);
    if (total <= 0 && price > 0 && count <= std::numeric_limits<std::int64_t>::max() / price) {
        total = price * count;
    }
    if (total > 0) {
        out.details.push_back("value " + format_currency(total));
    }
    if (event.field_bool({"paid"}).value_or(false)) {
        out.details.emplace_back("paid gift");
    }
    if (event.field_bool({"combo_gift"}).value_or(false)) {
        if (const auto combo = event.field_i64({"combo_info", "combo_count"})) {
            out.details.push_back(fmt::format("combo x{}", *combo));
        }
        if (const auto base = event.field_i64({"combo_info", "combo_base_num"})) {
            out.details.push_back(fmt::format("{} per combo", *base));
        }
    }
    push_medal(out.details, event);
    push_guard(out.details, event);
    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "msg_id", event.field_str({"msg_id"}));
    push_detail(out.details, "icon", event.field_str({"gift_icon"}));
    return out;
}

FormattedEvent format_super_chat(const LiveEvent& event) {
    FormattedEvent out;
    out.headline = fmt::format("[{}] {} super chat CNY {}: {}",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name_or_anonymous(event.field_str({"uname"})),
                               event.field_i64({"rmb"}).value_or(0),
                               event.field_str({"message"}).value_or("<empty>"));
    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    push_detail(out.details, "message_id", event.field_i64({"message_id"}));
    push_detail(out.details, "msg_id", event.field_str({"msg_id"}));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_medal(out.details, event);
    push_guard(out.details, event);
    const auto start = event.field_i64({"start_time"});
    const auto end = event.field_i64({"end_time"});
    if (start && end) {
        out.details.push_back(fmt::format("shown {} - {}", format_timestamp(start), format_timestamp(end)));
    }
    return out;
}

FormattedEvent format_super_chat_delete(const LiveEvent& event) {
    FormattedEvent out;
    std::vector<std::string> ids;
    if (auto it = event.data.find("message_ids"); it != event.data.end() && it->is_array()) {
        for (const auto& id : *it) {
            if (id.is_number_integer()) {
                ids.push_back(std::to_string(id.get<std::int64_t>()));
            }
        }
    }
    out.headline = fmt::format("[{}] super chat withdrawn: {}",
                               format_timestamp(event.field_i64({"timestamp"})),
                               ids.empty() ? std::string("-") : fmt::format("{}", fmt::join(ids, ", ")));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "msg_id", event.field_str({"msg_id"}));
    return out;
}

FormattedEvent format_guard(const LiveEvent& event) {
    FormattedEvent out;
    auto unit = event.field_str({"guard_unit"});
    out.headline = fmt::format("[{}] {} bought {} x{} ({})",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name_or_anonymous(event.field_str({"user_info", "uname"})),
                               guard_level_label(event.field_i64({"guard_level"}).value_or(0)),
                               event.field_i64({"guard_num"}).value_or(1),
                               unit && !unit->empty() ? *unit : std::string("month"));
    const auto price = event.field_i64({"price"}).value_or(0);
    if (price > 0) {
        out.details.push_back("value " + format_currency(price));
    }
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "open_id", event.field_str({"user_info", "open_id"}));
    push_medal(out.details, event);
    if (const auto wearing = event.field_bool({"fans_medal_wearing_status"})) {
        out.details.push_back(fmt::format("wearing medal: {}", *wearing ? "yes" : "no"));
    }
    return out;
}

FormattedEvent format_like(const LiveEvent& event) {
    FormattedEvent out;
    out.headline = fmt::format("[{}] {} liked {} times",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name_or_anonymous(event.field_str({"uname"})),
                               event.field_i64({"like_count"}).value_or(0));
    if (const auto text = event.field_str({"like_text"}); text && !text->empty()) {
        out.details.push_back("text: " + *text);
    }
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    return out;
}

FormattedEvent format_room_enter(const LiveEvent& event) {
    FormattedEvent out;
    out.headline = fmt::format("[{}] {} entered the room",
                               format_timestamp(event.field_i64({"timestamp"})),
                               name_or_anonymous(event.field_str({"uname"})));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    return out;
}

FormattedEvent format_live_state(const LiveEvent& event, const char* verb, const char* fallback_title) {
    FormattedEvent out;
    auto title = event.field_str({"title"});
    out.headline = fmt::format("[{}] live {}: {}",
                               format_timestamp(event.field_i64({"timestamp"})),
                               verb,
                               title && !title->empty() ? *title : std::string(fallback_title));
    push_detail(out.details, "area", event.field_str({"area_name"}));
    push_detail(out.details, "room_id", event.field_i64({"room_id"}));
    push_detail(out.details, "open_id", event.field_str({"open_id"}));
    return out;
}

}  // namespace

std::string FormattedEvent::to_string() const {
    if (details.empty()) {
        return headline;
    }
    return fmt::format("{}\n    {}", headline, fmt::join(details, " · "));
}

std::optional<FormattedEvent> format_event(const LiveEvent& event) {
    const auto& cmd = event.cmd;
    if (cmd == "LIVE_OPEN_PLATFORM_DM") {
        return format_dm(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_SEND_GIFT") {
        return format_gift(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_SUPER_CHAT") {
        return format_super_chat(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_SUPER_CHAT_DEL") {
        return format_super_chat_delete(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_GUARD") {
        return format_guard(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_LIKE") {
        return format_like(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_LIVE_ROOM_ENTER") {
        return format_room_enter(event);
    }
    if (cmd == "LIVE_OPEN_PLATFORM_LIVE_START") {
        return format_live_state(event, "started", "live started");
    }
    if (cmd == "LIVE_OPEN_PLATFORM_LIVE_END") {
        return format_live_state(event, "ended", "live ended");
    }
    if (cmd == "LIVE_OPEN_PLATFORM_INTERACTION_END") {
        FormattedEvent out;
        out.headline = fmt::format("[{}] push ended, game_id: {}",
                                   format_timestamp(event.field_i64({"timestamp"})),
                                   event.field_str({"game_id"}).value_or("-"));
        return out;
    }
    return std::nullopt;
}

std::string format_timestamp(std::optional<std::int64_t> unix_seconds) {
    if (!unix_seconds) {
        return "--:--:--";
    }
    return util::format_unix_beijing(*unix_seconds).value_or("--:--:--");
}

std::string format_currency(std::int64_t milli_units) {
    return fmt::format("{:.2f} CNY", static_cast<double>(milli_units) / 1000.0);
}

std::string guard_level_label(std::int64_t level) {
    switch (level) {
    case 1:
        return "governor";
    case 2:
        return "admiral";
    case 3:
        return "captain";
    default:
        return fmt::format("level {}", level);
    }
}

}  // namespace livelink::live
