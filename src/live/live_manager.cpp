#include "livelink/live/live_manager.hpp"

#include "livelink/errors.hpp"

#include <spdlog/spdlog.h>

namespace livelink::live {

namespace {

LiveSession::Options session_options(const api::LiveConfig& config, std::optional<LiveSession::Options> options) {
    if (options) {
        return *options;
    }
    LiveSession::Options defaults;
    defaults.api_heartbeat_interval = config.heartbeat_interval();
    return defaults;
}

}  // namespace

LiveManager::LiveManager(api::LiveConfig config,
                         std::shared_ptr<api::OpenPlatformApi> api,
                         std::shared_ptr<EventBus> bus,
                         std::shared_ptr<EventQueue> queue,
                         ConnectionFactory factory,
                         std::optional<LiveSession::Options> options)
    : config_(std::move(config)),
      api_(std::move(api)),
      dispatcher_(std::make_shared<EventDispatcher>(std::move(bus), std::move(queue))),
      factory_(std::move(factory)),
      options_(session_options(config_, options)) {
    if (!api_) {
        throw ConfigError("LiveManager requires an open platform client");
    }
}

LiveManager::~LiveManager() {
    if (session_) {
        spdlog::warn("Live manager destroyed with session {} still active; aborting it",
                     session_->info().session_id);
        session_->abort();
    }
}

SessionInfo LiveManager::start() {
    return start(config_.identity_code.value_or(std::string{}));
}

SessionInfo LiveManager::start(const std::string& identity_code) {
    if (session_) {
        throw LiveError("session already active; stop it before starting another");
    }
    if (config_.access_key.empty() || config_.access_secret.empty()) {
        throw ConfigError("live.access_key and live.access_secret are required");
    }
    const std::string code = identity_code.empty() ? config_.identity_code.value_or(std::string{}) : identity_code;
    if (code.empty()) {
        throw ConfigError("live.identity_code is required to start a session");
    }

    auto started = api_->start(code);
    if (started.socket_urls.empty()) {
        throw ApiError(-1, "Open platform start returned no socket URL");
    }

    SessionInfo info;
    info.session_id = started.session_id;
    info.room_id = started.anchor.room_id.value_or(0);
    info.anchor_name = started.anchor.uname.value_or("Unknown");
    info.anchor_id = started.anchor.open_id;
    info.started_at = std::chrono::system_clock::now();

    spdlog::info("Open platform session {} started for room {} ({})", info.session_id, info.room_id, info.anchor_name);
    session_ = LiveSession::spawn(api_,
                                  started.socket_urls.front(),
                                  std::move(started.auth_body),
                                  info,
                                  factory_,
                                  dispatcher_,
                                  options_);
    return info;
}

std::optional<SessionInfo> LiveManager::stop() {
    if (!session_) {
        return std::nullopt;
    }
    auto session = std::move(session_);
    auto info = session->info();

    session->request_stop();
    const auto outcome = session->wait();
    if (!outcome.clean()) {
        spdlog::warn("Live session {} finished {}: {}",
                     info.session_id,
                     to_string(outcome.final_state),
                     outcome.error.value_or("no error recorded"));
    } else {
        spdlog::info("Live session {} stopped", info.session_id);
    }
    return info;
}

std::optional<SessionInfo> LiveManager::status() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->info();
}

std::optional<SessionState> LiveManager::session_state() const {
    if (!session_) {
        return std::nullopt;
    }
    return session_->state();
}

}  // namespace livelink::live
