#pragma once

#include <memory>
#include <optional>
#include <string>

#include "livelink/api/open_platform_client.hpp"
#include "livelink/live/event_bus.hpp"
#include "livelink/live/event_dispatcher.hpp"
#include "livelink/live/live_connection.hpp"
#include "livelink/live/live_session.hpp"
#include "livelink/live/session_info.hpp"

namespace livelink::live {

/**
 * Owns at most one live session. Callers serialise start/stop; status reads
 * are safe from the same thread at any time.
 */
class LiveManager {
public:
    LiveManager(api::LiveConfig config,
                std::shared_ptr<api::OpenPlatformApi> api,
                std::shared_ptr<EventBus> bus,
                std::shared_ptr<EventQueue> queue,
                ConnectionFactory factory = default_connection_factory(),
                std::optional<LiveSession::Options> options = std::nullopt);
    ~LiveManager();

    LiveManager(const LiveManager&) = delete;
    LiveManager& operator=(const LiveManager&) = delete;

    // Uses the configured identity code.
    SessionInfo start();
    SessionInfo start(const std::string& identity_code);

    // Returns nullopt when no session was active.
    std::optional<SessionInfo> stop();

    std::optional<SessionInfo> status() const;
    std::optional<SessionState> session_state() const;

    const api::LiveConfig& config() const { return config_; }

private:
    api::LiveConfig config_;
    std::shared_ptr<api::OpenPlatformApi> api_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    ConnectionFactory factory_;
    LiveSession::Options options_;
    std::unique_ptr<LiveSession> session_;
};

}  // namespace livelink::live
