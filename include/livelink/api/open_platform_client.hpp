#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "livelink/api/request_signer.hpp"
#include "livelink/util/url.hpp"

namespace livelink::api {

constexpr const char* kDefaultBaseUrl = "https://live-open.biliapi.com";
constexpr std::int64_t kMinHeartbeatIntervalSeconds = 5;
constexpr std::int64_t kDefaultHeartbeatIntervalSeconds = 20;

struct LiveConfig {
    std::string access_key;
    std::string access_secret;
    std::int64_t app_id{0};
    std::optional<std::string> identity_code;
    std::optional<std::string> host_override;
    std::int64_t heartbeat_interval_seconds{kDefaultHeartbeatIntervalSeconds};

    std::chrono::seconds heartbeat_interval() const;
    std::string base_url() const;
};

struct AnchorInfo {
    std::optional<std::int64_t> room_id;
    std::optional<std::string> uname;
    std::optional<std::string> open_id;
};

struct StartResult {
    std::string session_id;
    std::vector<std::string> socket_urls;
    std::string auth_body;
    AnchorInfo anchor;
};

struct ApiEnvelope {
    int code{0};
    std::string message;
    nlohmann::json data;
};

/**
 * Lifecycle calls of the live open platform. `start` raises ApiError on a
 * non-zero response code; `heartbeat` and `end` only log it.
 */
class OpenPlatformApi {
public:
    virtual ~OpenPlatformApi() = default;

    virtual StartResult start(const std::string& identity_code) = 0;
    virtual void heartbeat(const std::string& session_id) = 0;
    virtual void end(const std::string& session_id) = 0;
};

class OpenPlatformClient : public OpenPlatformApi {
public:
    explicit OpenPlatformClient(LiveConfig config,
                                std::chrono::seconds timeout = std::chrono::seconds(10));

    StartResult start(const std::string& identity_code) override;
    void heartbeat(const std::string& session_id) override;
    void end(const std::string& session_id) override;

    const LiveConfig& config() const { return config_; }

private:
    ApiEnvelope post(const std::string& path, const std::string& body, const char* label) const;

    LiveConfig config_;
    util::Url base_;
    RequestSigner signer_;
    std::chrono::seconds timeout_;
};

// Exposed for tests: envelope and payload parsing of the REST responses.
ApiEnvelope parse_envelope(const std::string& response_body, const char* label);
StartResult parse_start_result(const nlohmann::json& data);

}  // namespace livelink::api
