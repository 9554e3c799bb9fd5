#include "livelink/cli/config_loader.hpp"

#include "livelink/errors.hpp"

#include <cstdlib>
#include <map>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace livelink::cli {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw ConfigError("Field '" + field + "' must be a scalar");
    }
    return node.as<T>();
}

std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    auto value = node.as<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

AppConfig build_config(const YAML::Node& root) {
    auto live_node = root["live"];
    if (!live_node || !live_node.IsMap()) {
        throw ConfigError("configuration must contain a 'live' section");
    }

    AppConfig config;
    config.live.access_key = scalar_or_throw<std::string>(live_node["access_key"], "live.access_key");
    config.live.access_secret = scalar_or_throw<std::string>(live_node["access_secret"], "live.access_secret");
    config.live.app_id = scalar_or_throw<std::int64_t>(live_node["app_id"], "live.app_id");
    config.live.identity_code = optional_string(live_node["identity_code"]);
    config.live.host_override = optional_string(live_node["host"]);
    config.live.heartbeat_interval_seconds =
        live_node["heartbeat_interval_seconds"].as<std::int64_t>(api::kDefaultHeartbeatIntervalSeconds);
    if (config.live.heartbeat_interval_seconds < api::kMinHeartbeatIntervalSeconds) {
        config.live.heartbeat_interval_seconds = api::kMinHeartbeatIntervalSeconds;
    }

    if (auto events_node = root["events"]; events_node && events_node.IsMap()) {
        config.queue_capacity = events_node["queue_capacity"].as<std::size_t>(config.queue_capacity);
        if (config.queue_capacity == 0) {
            throw ConfigError("events.queue_capacity must be positive");
        }
    }
    if (auto logging_node = root["logging"]; logging_node && logging_node.IsMap()) {
        config.log_level = logging_node["level"].as<std::string>(config.log_level);
    }
    return config;
}

}  // namespace

AppConfig load_config(const std::string& path) {
    try {
        return build_config(YAML::LoadFile(path));
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to load " + path + ": " + ex.what());
    }
}

AppConfig parse_config(const std::string& yaml_text) {
    try {
        return build_config(YAML::Load(yaml_text));
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("Invalid configuration: ") + ex.what());
    }
}

std::string default_config_path() {
    if (const char* env = std::getenv("LIVELINK_CONFIG"); env && *env) {
        return env;
    }
    return "config/livelink.yaml";
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', falling back to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

}  // namespace livelink::cli
