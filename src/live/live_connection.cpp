#include "livelink/live/live_connection.hpp"

#include "livelink/errors.hpp"
#include "livelink/util/url.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace livelink::live {

namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds kConnectTimeout{10};

void run_pending(asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void throw_on_error(const beast::error_code& ec, const std::string& url, const char* step) {
    if (ec) {
        throw ConnectError("Live socket " + url + " failed during " + step + ": " + ec.message());
    }
}

class WebSocketConnection : public LiveConnection {
public:
    explicit WebSocketConnection(asio::io_context& ioc)
        : ioc_(ioc), ssl_ctx_(ssl::context::tls_client) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    void connect(const std::string& url) override {
        util::Url target;
        try {
            target = util::parse_url(url);
        } catch (const std::invalid_argument& ex) {
            throw ConnectError(ex.what());
        }
        if (target.scheme != "ws" && target.scheme != "wss") {
            throw ConnectError("Live socket URL must use ws or wss: " + url);
        }

        tcp::resolver resolver(ioc_);
        beast::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(target.host,
                               target.port,
                               [&](beast::error_code result, tcp::resolver::results_type found) {
                                   ec = result;
                                   endpoints = std::move(found);
                               });
        run_pending(ioc_);
        throw_on_error(ec, url, "resolve");

        if (target.secure()) {
            tls_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);
            if (!SSL_set_tlsext_host_name(tls_->next_layer().native_handle(), target.host.c_str())) {
                throw ConnectError("Failed to set TLS SNI host name " + target.host);
            }
            tls_->next_layer().set_verify_callback(ssl::host_name_verification(target.host));

            connect_lowest_layer(*tls_, endpoints, url);
            beast::get_lowest_layer(*tls_).expires_after(kConnectTimeout);
            tls_->next_layer().async_handshake(ssl::stream_base::client,
                                               [&ec](beast::error_code result) { ec = result; });
            run_pending(ioc_);
            throw_on_error(ec, url, "TLS handshake");
            handshake(*tls_, target, url);
        } else {
            plain_ = std::make_unique<PlainStream>(ioc_);
            connect_lowest_layer(*plain_, endpoints, url);
            handshake(*plain_, target, url);
        }

        spdlog::info("Live socket connected to {}://{}:{}{}", target.scheme, target.host, target.port, target.target);
    }

    void async_read(ReadHandler handler) override {
        visit([this, &handler](auto& stream) {
            stream.async_read(read_buffer_,
                              [this, &stream, handler = std::move(handler)](beast::error_code ec, std::size_t) {
                                  std::vector<std::uint8_t> payload;
                                  bool binary = false;
                                  if (!ec) {
                                      const auto data = read_buffer_.cdata();
                                      const auto* begin = static_cast<const std::uint8_t*>(data.data());
                                      payload.assign(begin, begin + data.size());
                                      binary = stream.got_binary();
                                  }
                                  read_buffer_.consume(read_buffer_.size());
                                  handler(ec, std::move(payload), binary);
                              });
        });
    }

    void async_write(std::vector<std::uint8_t> payload, CompletionHandler handler) override {
        auto buffer = std::make_shared<std::vector<std::uint8_t>>(std::move(payload));
        visit([&buffer, &handler](auto& stream) {
            stream.binary(true);
            stream.async_write(asio::buffer(*buffer),
                               [buffer, handler = std::move(handler)](beast::error_code ec, std::size_t) {
                                   handler(ec);
                               });
        });
    }

    void async_close(CompletionHandler handler) override {
        visit([&handler](auto& stream) {
            stream.async_close(websocket::close_code::normal,
                               [handler = std::move(handler)](beast::error_code ec) { handler(ec); });
        });
    }

    bool is_open() const override {
        if (tls_) {
            return tls_->is_open();
        }
        return plain_ && plain_->is_open();
    }

private:
    using PlainStream = websocket::stream<beast::tcp_stream>;
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    template <class F>
    void visit(F&& f) {
        if (tls_) {
            f(*tls_);
        } else if (plain_) {
            f(*plain_);
        } else {
            throw TransportError("Live socket is not connected");
        }
    }

    template <class Stream>
    void connect_lowest_layer(Stream& stream, const tcp::resolver::results_type& endpoints, const std::string& url) {
        beast::error_code ec;
        beast::get_lowest_layer(stream).expires_after(kConnectTimeout);
        beast::get_lowest_layer(stream).async_connect(
            endpoints, [&ec](beast::error_code result, const tcp::endpoint&) { ec = result; });
        run_pending(ioc_);
        throw_on_error(ec, url, "connect");
    }

    template <class Stream>
    void handshake(Stream& stream, const util::Url& target, const std::string& url) {
        // The websocket stream runs its own timers once the upgrade starts.
        beast::get_lowest_layer(stream).expires_never();
        stream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        stream.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "livelink/0.1");
        }));

        beast::error_code ec;
        stream.async_handshake(target.host_header(),
                               target.target,
                               [&ec](beast::error_code result) { ec = result; });
        run_pending(ioc_);
        throw_on_error(ec, url, "websocket handshake");
        stream.binary(true);
    }

    asio::io_context& ioc_;
    ssl::context ssl_ctx_;
    std::unique_ptr<TlsStream> tls_;
    std::unique_ptr<PlainStream> plain_;
    beast::flat_buffer read_buffer_;
};

}  // namespace

ConnectionFactory default_connection_factory() {
    return [](asio::io_context& ioc) -> std::unique_ptr<LiveConnection> {
        return std::make_unique<WebSocketConnection>(ioc);
    };
}

}  // namespace livelink::live
