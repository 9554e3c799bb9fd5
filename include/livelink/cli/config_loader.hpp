#pragma once

#include <cstddef>
#include <string>

#include "livelink/api/open_platform_client.hpp"

#include <spdlog/common.h>

namespace livelink::cli {

struct AppConfig {
    api::LiveConfig live;
    std::size_t queue_capacity{256};
    std::string log_level{"info"};
};

// Throws ConfigError on a missing file, bad YAML or missing credentials.
AppConfig load_config(const std::string& path);
AppConfig parse_config(const std::string& yaml_text);

// $LIVELINK_CONFIG, falling back to config/livelink.yaml.
std::string default_config_path();

// Unknown names are logged and fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

}  // namespace livelink::cli
