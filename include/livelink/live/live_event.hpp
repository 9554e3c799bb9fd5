#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace livelink::live {

constexpr const char* kLiveEventName = "live.event";

struct LiveEvent {
    std::string cmd;
    nlohmann::json data;

    // Walk `path` into `data`; empty when a key is missing or the leaf has another type.
    std::optional<std::string> field_str(std::initializer_list<std::string_view> path) const;
    std::optional<std::int64_t> field_i64(std::initializer_list<std::string_view> path) const;
    std::optional<bool> field_bool(std::initializer_list<std::string_view> path) const;

    nlohmann::json to_json() const;
};

}  // namespace livelink::live
