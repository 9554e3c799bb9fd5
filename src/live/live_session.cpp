#include "livelink/live/live_session.hpp"

#include "livelink/errors.hpp"
#include "livelink/protocol/packet_codec.hpp"
#include "livelink/util/url.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/websocket/error.hpp>
#include <spdlog/spdlog.h>

namespace livelink::live {

namespace asio = boost::asio;

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Starting:
        return "starting";
    case SessionState::Connected:
        return "connected";
    case SessionState::Listening:
        return "listening";
    case SessionState::ShuttingDown:
        return "shutting down";
    case SessionState::Closed:
        return "closed";
    case SessionState::Failed:
        return "failed";
    }
    return "unknown";
}

std::unique_ptr<LiveSession> LiveSession::spawn(std::shared_ptr<api::OpenPlatformApi> api,
                                                const std::string& socket_url,
                                                std::string auth_body,
                                                SessionInfo info,
                                                const ConnectionFactory& factory,
                                                std::shared_ptr<EventDispatcher> dispatcher,
                                                Options options) {
    std::unique_ptr<LiveSession> session(
        new LiveSession(std::move(api), std::move(auth_body), std::move(info), std::move(dispatcher), options));

    const auto url = util::with_subscription_path(socket_url);
    session->connection_ = factory(session->io_context_);
    if (!session->connection_) {
        throw ConnectError("No live connection available for " + url);
    }
    session->connection_->connect(url);
    session->state_ = SessionState::Connected;

    auto* self = session.get();
    self->io_context_.restart();
    asio::post(self->io_context_, [self] { self->begin_listening(); });
    self->cancel_token_.on_cancel([self] {
        asio::post(self->io_context_, [self] { self->begin_shutdown(std::nullopt); });
    });
    self->thread_ = std::thread([self] { self->run(); });
    return session;
}

LiveSession::LiveSession(std::shared_ptr<api::OpenPlatformApi> api,
                         std::string auth_body,
                         SessionInfo info,
                         std::shared_ptr<EventDispatcher> dispatcher,
                         Options options)
    : api_(std::move(api)),
      auth_body_(std::move(auth_body)),
      info_(std::move(info)),
      dispatcher_(std::move(dispatcher)),
      options_(options),
      keepalive_timer_(io_context_),
      api_timer_(io_context_),
      cancel_token_(cancel_source_.token()) {}

LiveSession::~LiveSession() {
    if (thread_.joinable()) {
        abort();
    }
}

void LiveSession::request_stop() {
    cancel_source_.cancel();
}

SessionOutcome LiveSession::wait() {
    join();
    std::lock_guard<std::mutex> lock(outcome_mutex_);
    return SessionOutcome{state_.load(), error_};
}

void LiveSession::abort() {
    if (!terminal()) {
        aborted_ = true;
        io_context_.stop();
    }
    join();
    if (!terminal()) {
        {
            std::lock_guard<std::mutex> lock(outcome_mutex_);
            if (!error_) {
                error_ = "session aborted";
            }
        }
        state_ = SessionState::Failed;
        spdlog::warn("Live session {} aborted without ending it upstream", info_.session_id);
    }
}

void LiveSession::run() {
    try {
        io_context_.run();
    } catch (const std::exception& ex) {
        spdlog::error("Live session {} stopped by an exception: {}", info_.session_id, ex.what());
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        error_ = ex.what();
        state_ = SessionState::Failed;
        return;
    }
    if (!terminal() && !aborted_) {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        error_ = "session loop exited unexpectedly";
        state_ = SessionState::Failed;
    }
}

void LiveSession::begin_listening() {
    if (stopping()) {
        begin_shutdown(std::nullopt);
        return;
    }

    const auto* body = reinterpret_cast<const std::uint8_t*>(auth_body_.data());
    enqueue(PendingWrite{protocol::encode(protocol::Operation::Auth, std::span(body, auth_body_.size())), true});
    state_ = SessionState::Listening;
    spdlog::info("Live session {} listening (room {}, anchor {})", info_.session_id, info_.room_id, info_.anchor_name);

    arm_keepalive();
    arm_api_heartbeat();
    read_next();
}

void LiveSession::arm_keepalive() {
    keepalive_timer_.expires_after(options_.keepalive_interval);
    keepalive_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping()) {
            return;
        }
        enqueue(PendingWrite{protocol::encode(protocol::Operation::Heartbeat, {}), false});
        arm_keepalive();
    });
}

void LiveSession::arm_api_heartbeat() {
    api_timer_.expires_after(options_.api_heartbeat_interval);
    api_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping()) {
            return;
        }
        try {
            api_->heartbeat(info_.session_id);
        } catch (const std::exception& ex) {
            spdlog::warn("Open platform heartbeat for {} failed: {}", info_.session_id, ex.what());
        }
        arm_api_heartbeat();
    });
}

void LiveSession::read_next() {
    connection_->async_read([this](boost::system::error_code ec, std::vector<std::uint8_t> payload, bool binary) {
        on_read(ec, std::move(payload), binary);
    });
}

void LiveSession::on_read(const boost::system::error_code& ec, std::vector<std::uint8_t> payload, bool binary) {
    if (shutting_down_) {
        return;
    }
    if (ec == boost::beast::websocket::error::closed) {
        spdlog::info("Live socket for {} closed by the server", info_.session_id);
        begin_shutdown(std::nullopt);
        return;
    }
    if (ec) {
        begin_shutdown("Live socket read failed: " + ec.message());
        return;
    }

    if (!binary) {
        spdlog::debug("Ignoring text message on live socket ({} bytes)", payload.size());
    } else if (dispatcher_) {
        dispatcher_->dispatch_payload(payload);
    }

    if (!stopping()) {
        read_next();
    }
}

void LiveSession::enqueue(PendingWrite write) {
    if (shutting_down_) {
        return;
    }
    writes_.push_back(std::move(write));
    if (!writing_) {
        write_next();
    }
}

void LiveSession::write_next() {
    if (writes_.empty() || shutting_down_) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto next = std::move(writes_.front());
    writes_.pop_front();

    const bool auth = next.auth;
    connection_->async_write(std::move(next.bytes), [this, auth](boost::system::error_code ec) {
        writing_ = false;
        if (ec && !shutting_down_) {
            if (auth) {
                begin_shutdown("Failed to send AUTH frame: " + ec.message());
                return;
            }
            spdlog::warn("Live heartbeat frame send failed: {}", ec.message());
        }
        write_next();
    });
}

void LiveSession::begin_shutdown(std::optional<std::string> error) {
    if (shutting_down_) {
        return;
    }
    shutting_down_ = true;
    state_ = SessionState::ShuttingDown;
    if (error) {
        spdlog::warn("Live session {} shutting down: {}", info_.session_id, *error);
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        error_ = std::move(error);
    } else {
        spdlog::info("Live session {} shutting down", info_.session_id);
    }

    keepalive_timer_.cancel();
    api_timer_.cancel();
    writes_.clear();

    if (!end_called_) {
        end_called_ = true;
        try {
            api_->end(info_.session_id);
        } catch (const std::exception& ex) {
            spdlog::warn("Open platform end for {} failed: {}", info_.session_id, ex.what());
        }
    }

    if (connection_->is_open()) {
        connection_->async_close([this](boost::system::error_code ec) {
            if (ec) {
                spdlog::debug("Live socket close for {}: {}", info_.session_id, ec.message());
            }
            finish();
        });
    } else {
        finish();
    }
}

void LiveSession::finish() {
    bool failed = false;
    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        failed = error_.has_value();
    }
    state_ = failed ? SessionState::Failed : SessionState::Closed;
    spdlog::info("Live session {} {}", info_.session_id, to_string(state_.load()));
}

bool LiveSession::stopping() const {
    return shutting_down_ || cancel_token_.cancelled();
}

bool LiveSession::terminal() const {
    const auto state = state_.load();
    return state == SessionState::Closed || state == SessionState::Failed;
}

void LiveSession::join() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

}  // namespace livelink::live
