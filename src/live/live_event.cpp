#include "livelink/live/live_event.hpp"

#include <limits>

namespace livelink::live {

namespace {

const nlohmann::json* walk(const nlohmann::json& root, std::initializer_list<std::string_view> path) {
    const nlohmann::json* current = &root;
    for (const auto key : path) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(std::string(key));
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

}  // namespace

std::optional<std::string> LiveEvent::field_str(std::initializer_list<std::string_view> path) const {
    const auto* value = walk(data, path);
    if (!value || !value->is_string()) {
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<std::int64_t> LiveEvent::field_i64(std::initializer_list<std::string_view> path) const {
    const auto* value = walk(data, path);
    if (!value || !value->is_number_integer()) {
        return std::nullopt;
    }
    if (value->is_number_unsigned() &&
        value->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return value->get<std::int64_t>();
}

std::optional<bool> LiveEvent::field_bool(std::initializer_list<std::string_view> path) const {
    const auto* value = walk(data, path);
    if (!value || !value->is_boolean()) {
        return std::nullopt;
    }
    return value->get<bool>();
}

nlohmann::json LiveEvent::to_json() const {
    return nlohmann::json{{"cmd", cmd}, {"data", data}};
}

}  // namespace livelink::live
