#include "livelink/api/open_platform_client.hpp"

#include "livelink/errors.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace livelink::api {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Runs the private context until the single outstanding operation completes.
void run_pending(asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void throw_on_error(const beast::error_code& ec, const char* label, const char* step) {
    if (ec) {
        throw TransportError(std::string("Open platform ") + label + " request failed during " + step + ": " +
                             ec.message());
    }
}

template <class Stream>
Response exchange(asio::io_context& ioc,
                  Stream& stream,
                  const Request& request,
                  std::chrono::seconds timeout,
                  const char* label) {
    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, request, [&ec](beast::error_code result, std::size_t) { ec = result; });
    run_pending(ioc);
    throw_on_error(ec, label, "write");

    beast::flat_buffer buffer;
    Response response;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, response, [&ec](beast::error_code result, std::size_t) { ec = result; });
    run_pending(ioc);
    throw_on_error(ec, label, "read");
    return response;
}

tcp::resolver::results_type resolve(asio::io_context& ioc, const util::Url& url, const char* label) {
    tcp::resolver resolver(ioc);
    beast::error_code ec;
    tcp::resolver::results_type results;
    resolver.async_resolve(url.host, url.port, [&](beast::error_code result, tcp::resolver::results_type found) {
        ec = result;
        results = std::move(found);
    });
    run_pending(ioc);
    throw_on_error(ec, label, "resolve");
    return results;
}

Response send_plain(const util::Url& url, const Request& request, std::chrono::seconds timeout, const char* label) {
    asio::io_context ioc;
    const auto endpoints = resolve(ioc, url, label);

    beast::tcp_stream stream(ioc);
    beast::error_code ec;
    stream.expires_after(timeout);
    stream.async_connect(endpoints, [&ec](beast::error_code result, const tcp::endpoint&) { ec = result; });
    run_pending(ioc);
    throw_on_error(ec, label, "connect");

    auto response = exchange(ioc, stream, request, timeout, label);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Open platform {} socket shutdown: {}", label, ec.message());
    }
    return response;
}

Response send_tls(const util::Url& url, const Request& request, std::chrono::seconds timeout, const char* label) {
    asio::io_context ioc;
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    const auto endpoints = resolve(ioc, url, label);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw TransportError("Failed to set TLS SNI host name " + url.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).async_connect(
        endpoints, [&ec](beast::error_code result, const tcp::endpoint&) { ec = result; });
    run_pending(ioc);
    throw_on_error(ec, label, "connect");

    beast::get_lowest_layer(stream).expires_after(timeout);
    stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code result) { ec = result; });
    run_pending(ioc);
    throw_on_error(ec, label, "TLS handshake");

    auto response = exchange(ioc, stream, request, timeout, label);

    beast::get_lowest_layer(stream).expires_after(timeout);
    stream.async_shutdown([&ec](beast::error_code result) { ec = result; });
    run_pending(ioc);
    if (ec && ec != asio::ssl::error::stream_truncated) {
        spdlog::debug("Open platform {} TLS shutdown: {}", label, ec.message());
    }
    return response;
}

util::Url parse_base_url(const std::string& text) {
    util::Url url;
    try {
        url = util::parse_url(text);
    } catch (const std::invalid_argument& ex) {
        throw ConfigError(ex.what());
    }
    if (url.scheme != "http" && url.scheme != "https") {
        throw ConfigError("Open platform host must be an http(s) URL: " + text);
    }
    if (url.target == "/") {
        url.target.clear();
    } else if (url.target.back() == '/') {
        url.target.pop_back();
    }
    return url;
}

std::string optional_string(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

std::chrono::seconds LiveConfig::heartbeat_interval() const {
    return std::chrono::seconds(std::max(heartbeat_interval_seconds, kMinHeartbeatIntervalSeconds));
}

std::string LiveConfig::base_url() const {
    if (host_override && !host_override->empty()) {
        return *host_override;
    }
    return kDefaultBaseUrl;
}

OpenPlatformClient::OpenPlatformClient(LiveConfig config, std::chrono::seconds timeout)
    : config_(std::move(config)),
      base_(parse_base_url(config_.base_url())),
      signer_(config_.access_key, config_.access_secret),
      timeout_(timeout) {}

StartResult OpenPlatformClient::start(const std::string& identity_code) {
    const nlohmann::json body = {{"code", identity_code}, {"app_id", config_.app_id}};
    auto envelope = post("/v2/app/start", body.dump(), "start");
    if (envelope.code != 0) {
        throw ApiError(envelope.code,
                       "Open platform start returned " + std::to_string(envelope.code) + ": " + envelope.message);
    }
    return parse_start_result(envelope.data);
}

void OpenPlatformClient::heartbeat(const std::string& session_id) {
    const nlohmann::json body = {{"game_id", session_id}};
    const auto envelope = post("/v2/app/heartbeat", body.dump(), "heartbeat");
    if (envelope.code != 0) {
        spdlog::warn("Open platform heartbeat rejected: code={} message={}", envelope.code, envelope.message);
    }
}

void OpenPlatformClient::end(const std::string& session_id) {
    const nlohmann::json body = {{"app_id", config_.app_id}, {"game_id", session_id}};
    const auto envelope = post("/v2/app/end", body.dump(), "end");
    if (envelope.code != 0) {
        spdlog::warn("Open platform end rejected: code={} message={}", envelope.code, envelope.message);
    }
}

ApiEnvelope OpenPlatformClient::post(const std::string& path, const std::string& body, const char* label) const {
    const auto headers = signer_.sign(body);

    Request request{http::verb::post, base_.target + path, 11};
    request.set(http::field::host, base_.host_header());
    request.set(http::field::user_agent, "livelink/0.1 " BOOST_BEAST_VERSION_STRING);
    request.set(http::field::accept, "application/json");
    request.set(http::field::content_type, "application/json");
    for (const auto& [name, value] : headers.fields()) {
        request.set(name, value);
    }
    request.body() = body;
    request.prepare_payload();

    spdlog::debug("POST {}://{}{} ({} bytes)",
                  base_.scheme,
                  base_.host_header(),
                  std::string(request.target()),
                  body.size());

    const auto response = base_.secure() ? send_tls(base_, request, timeout_, label)
                                         : send_plain(base_, request, timeout_, label);
    if (response.result_int() < 200 || response.result_int() >= 300) {
        throw ApiError(static_cast<int>(response.result_int()),
                       std::string("Open platform ") + label + " returned HTTP " +
                           std::to_string(response.result_int()));
    }
    return parse_envelope(response.body(), label);
}

ApiEnvelope parse_envelope(const std::string& response_body, const char* label) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(response_body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ApiError(-1, std::string("Open platform ") + label + " returned invalid JSON: " + ex.what());
    }
    if (!root.is_object()) {
        throw ApiError(-1, std::string("Open platform ") + label + " returned a non-object envelope");
    }

    ApiEnvelope envelope;
    if (auto code = root.find("code"); code != root.end() && code->is_number_integer()) {
        envelope.code = code->get<int>();
    }
    envelope.message = optional_string(root, "message");
    if (auto data = root.find("data"); data != root.end()) {
        envelope.data = *data;
    }
    return envelope;
}

StartResult parse_start_result(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ApiError(-1, "Open platform start response has no data object");
    }

    StartResult result;
    const auto game_info = data.find("game_info");
    const auto websocket_info = data.find("websocket_info");
    if (game_info == data.end() || !game_info->is_object() || websocket_info == data.end() ||
        !websocket_info->is_object()) {
        throw ApiError(-1, "Open platform start response is missing game_info or websocket_info");
    }

    const auto game_id = game_info->find("game_id");
    if (game_id == game_info->end() || !game_id->is_string()) {
        throw ApiError(-1, "Open platform start response has no game_info.game_id");
    }
    const auto auth_body = websocket_info->find("auth_body");
    if (auth_body == websocket_info->end() || !auth_body->is_string()) {
        throw ApiError(-1, "Open platform start response has no websocket_info.auth_body");
    }
    result.session_id = game_id->get<std::string>();
    result.auth_body = auth_body->get<std::string>();
    if (auto links = websocket_info->find("wss_link"); links != websocket_info->end() && links->is_array()) {
        for (const auto& link : *links) {
            if (link.is_string()) {
                result.socket_urls.push_back(link.get<std::string>());
            }
        }
    }

    if (auto anchor = data.find("anchor_info"); anchor != data.end() && anchor->is_object()) {
        if (auto room = anchor->find("room_id"); room != anchor->end() && room->is_number_integer()) {
            result.anchor.room_id = room->get<std::int64_t>();
        }
        if (auto uname = anchor->find("uname"); uname != anchor->end() && uname->is_string()) {
            result.anchor.uname = uname->get<std::string>();
        }
        if (auto open_id = anchor->find("open_id"); open_id != anchor->end() && open_id->is_string()) {
            result.anchor.open_id = open_id->get<std::string>();
        }
    }
    return result;
}

}  // namespace livelink::api
