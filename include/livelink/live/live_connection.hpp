#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

namespace livelink::live {

/**
 * Message-oriented socket used by a live session. `connect` is synchronous and
 * runs the io_context itself; all other operations complete as handlers on
 * that io_context. A clean server close completes the pending read with
 * `boost::beast::websocket::error::closed`.
 */
class LiveConnection {
public:
    using ReadHandler =
        std::function<void(boost::system::error_code, std::vector<std::uint8_t> payload, bool binary)>;
    using CompletionHandler = std::function<void(boost::system::error_code)>;

    virtual ~LiveConnection() = default;

    // Throws ConnectError.
    virtual void connect(const std::string& url) = 0;
    virtual void async_read(ReadHandler handler) = 0;
    virtual void async_write(std::vector<std::uint8_t> payload, CompletionHandler handler) = 0;
    virtual void async_close(CompletionHandler handler) = 0;
    virtual bool is_open() const = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<LiveConnection>(boost::asio::io_context&)>;

// Beast websocket over TLS (wss) or plain TCP (ws).
ConnectionFactory default_connection_factory();

}  // namespace livelink::live
