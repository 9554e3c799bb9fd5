#pragma once

#include "livelink/api/open_platform_client.hpp"
#include "livelink/errors.hpp"
#include "livelink/live/live_connection.hpp"
#include "livelink/protocol/packet_codec.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace livelink::testing {

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

inline std::vector<std::uint8_t> event_frame(const std::string& body) {
    const auto raw = bytes_of(body);
    return protocol::encode(protocol::Operation::SendEvent, raw);
}

class FakeApi : public api::OpenPlatformApi {
public:
    FakeApi() {
        result.session_id = "game-1";
        result.socket_urls = {"wss://push.example.test/path"};
        result.auth_body = R"({"key":"auth"})";
        result.anchor.room_id = 4242;
        result.anchor.uname = "anchor";
        result.anchor.open_id = "open-1";
    }

    api::StartResult start(const std::string& identity_code) override {
        ++start_calls;
        {
            std::lock_guard<std::mutex> lock(mutex);
            last_code = identity_code;
        }
        if (start_error) {
            throw ApiError(7001, "start rejected");
        }
        return result;
    }

    void heartbeat(const std::string&) override {
        ++heartbeat_calls;
        if (heartbeat_error) {
            throw TransportError("heartbeat unreachable");
        }
    }

    void end(const std::string&) override {
        ++end_calls;
        if (end_error) {
            throw TransportError("end unreachable");
        }
    }

    std::string code() {
        std::lock_guard<std::mutex> lock(mutex);
        return last_code;
    }

    api::StartResult result;
    bool start_error{false};
    bool end_error{false};
    std::atomic<bool> heartbeat_error{false};
    std::atomic<int> start_calls{0};
    std::atomic<int> heartbeat_calls{0};
    std::atomic<int> end_calls{0};

private:
    std::mutex mutex;
    std::string last_code;
};

/**
 * Server side of a scripted connection. The test thread pushes inbound
 * messages and inspects written frames; socket callbacks run on the
 * session's io_context.
 */
class FakeSocket : public std::enable_shared_from_this<FakeSocket> {
public:
    void deliver(std::vector<std::uint8_t> payload, bool binary = true) {
        post([self = shared_from_this(), payload = std::move(payload), binary]() mutable {
            self->inbound_.push_back(Inbound{std::move(payload), binary, {}});
            self->pump();
        });
    }

    void server_close() { fail_read(boost::beast::websocket::error::closed); }

    // The next pending read completes with `ec`.
    void fail_read(boost::system::error_code ec) {
        post([self = shared_from_this(), ec] {
            self->inbound_.push_back(Inbound{{}, false, ec});
            self->pump();
        });
    }

    std::vector<std::vector<std::uint8_t>> written() {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    std::vector<protocol::Frame> written_frames() {
        std::vector<protocol::Frame> frames;
        for (const auto& message : written()) {
            auto decoded = protocol::decode(message);
            frames.insert(frames.end(), decoded.begin(), decoded.end());
        }
        return frames;
    }

    std::string connected_url() {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_url_;
    }

    bool fail_connect{false};
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> open{false};
    std::atomic<int> close_calls{0};

private:
    friend class FakeConnection;

    struct Inbound {
        std::vector<std::uint8_t> payload;
        bool binary{true};
        boost::system::error_code error;
    };

    void post(std::function<void()> fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (io_context_) {
            boost::asio::post(*io_context_, std::move(fn));
        }
    }

    void pump() {
        if (!pending_read_ || inbound_.empty()) {
            return;
        }
        auto handler = std::move(pending_read_);
        pending_read_ = nullptr;
        auto next = std::move(inbound_.front());
        inbound_.pop_front();
        if (next.error) {
            if (next.error == boost::beast::websocket::error::closed) {
                open = false;
            }
            handler(next.error, {}, false);
            return;
        }
        handler({}, std::move(next.payload), next.binary);
    }

    std::mutex mutex_;
    boost::asio::io_context* io_context_{nullptr};
    std::string connected_url_;
    std::vector<std::vector<std::uint8_t>> written_;
    std::deque<Inbound> inbound_;
    live::LiveConnection::ReadHandler pending_read_;
};

class FakeConnection : public live::LiveConnection {
public:
    FakeConnection(boost::asio::io_context& io_context, std::shared_ptr<FakeSocket> socket)
        : io_context_(io_context), socket_(std::move(socket)) {}

    void connect(const std::string& url) override {
        std::lock_guard<std::mutex> lock(socket_->mutex_);
        socket_->connected_url_ = url;
        if (socket_->fail_connect) {
            throw ConnectError("handshake refused for " + url);
        }
        socket_->io_context_ = &io_context_;
        socket_->open = true;
    }

    void async_read(ReadHandler handler) override {
        socket_->pending_read_ = std::move(handler);
        boost::asio::post(io_context_, [socket = socket_] { socket->pump(); });
    }

    void async_write(std::vector<std::uint8_t> payload, CompletionHandler handler) override {
        boost::system::error_code ec;
        if (socket_->fail_writes) {
            ec = boost::asio::error::broken_pipe;
        } else {
            std::lock_guard<std::mutex> lock(socket_->mutex_);
            socket_->written_.push_back(std::move(payload));
        }
        boost::asio::post(io_context_, [handler = std::move(handler), ec] { handler(ec); });
    }

    void async_close(CompletionHandler handler) override {
        ++socket_->close_calls;
        socket_->open = false;
        if (auto pending = std::move(socket_->pending_read_)) {
            socket_->pending_read_ = nullptr;
            boost::asio::post(io_context_, [pending = std::move(pending)] {
                pending(boost::asio::error::operation_aborted, {}, false);
            });
        }
        boost::asio::post(io_context_, [handler = std::move(handler)] { handler({}); });
    }

    bool is_open() const override { return socket_->open; }

private:
    boost::asio::io_context& io_context_;
    std::shared_ptr<FakeSocket> socket_;
};

inline live::ConnectionFactory fake_factory(const std::shared_ptr<FakeSocket>& socket) {
    return [socket](boost::asio::io_context& io_context) -> std::unique_ptr<live::LiveConnection> {
        return std::make_unique<FakeConnection>(io_context, socket);
    };
}

}  // namespace livelink::testing
