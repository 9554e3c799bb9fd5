#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "livelink/api/open_platform_client.hpp"
#include "livelink/live/event_dispatcher.hpp"
#include "livelink/live/live_connection.hpp"
#include "livelink/live/session_info.hpp"
#include "livelink/util/cancellation.hpp"

namespace livelink::live {

enum class SessionState { Starting, Connected, Listening, ShuttingDown, Closed, Failed };

const char* to_string(SessionState state);

struct SessionOutcome {
    SessionState final_state{SessionState::Closed};
    std::optional<std::string> error;

    bool clean() const { return final_state == SessionState::Closed && !error; }
};

/**
 * One authenticated push connection. All socket, timer and REST keep-alive
 * work runs on a private io_context driven by a single thread; the public
 * methods may be called from any other thread.
 */
class LiveSession {
public:
    struct Options {
        std::chrono::milliseconds keepalive_interval{std::chrono::seconds(20)};
        std::chrono::milliseconds api_heartbeat_interval{std::chrono::seconds(20)};
    };

    // Connects to `socket_url` (with the subscription path applied) and starts
    // the session thread. Throws ConnectError if the handshake fails.
    static std::unique_ptr<LiveSession> spawn(std::shared_ptr<api::OpenPlatformApi> api,
                                              const std::string& socket_url,
                                              std::string auth_body,
                                              SessionInfo info,
                                              const ConnectionFactory& factory,
                                              std::shared_ptr<EventDispatcher> dispatcher,
                                              Options options);

    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    const SessionInfo& info() const { return info_; }
    SessionState state() const { return state_.load(); }

    // Cooperative stop: end() is called and the socket closed on the session thread.
    void request_stop();

    // Blocks until the session thread has finished.
    SessionOutcome wait();

    // Stops the io_context without calling end().
    void abort();

private:
    struct PendingWrite {
        std::vector<std::uint8_t> bytes;
        bool auth{false};
    };

    LiveSession(std::shared_ptr<api::OpenPlatformApi> api,
                std::string auth_body,
                SessionInfo info,
                std::shared_ptr<EventDispatcher> dispatcher,
                Options options);

    void run();
    void begin_listening();
    void arm_keepalive();
    void arm_api_heartbeat();
    void read_next();
    void on_read(const boost::system::error_code& ec, std::vector<std::uint8_t> payload, bool binary);
    void enqueue(PendingWrite write);
    void write_next();
    void begin_shutdown(std::optional<std::string> error);
    void finish();
    bool stopping() const;
    bool terminal() const;
    void join();

    std::shared_ptr<api::OpenPlatformApi> api_;
    std::string auth_body_;
    SessionInfo info_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    Options options_;

    boost::asio::io_context io_context_;
    std::unique_ptr<LiveConnection> connection_;
    boost::asio::steady_timer keepalive_timer_;
    boost::asio::steady_timer api_timer_;
    std::deque<PendingWrite> writes_;
    bool writing_{false};
    bool shutting_down_{false};
    bool end_called_{false};

    util::CancellationSource cancel_source_;
    util::CancellationToken cancel_token_;

    std::atomic<SessionState> state_{SessionState::Starting};
    std::atomic<bool> aborted_{false};
    std::mutex outcome_mutex_;
    std::optional<std::string> error_;
    std::mutex join_mutex_;
    std::thread thread_;
};

}  // namespace livelink::live
