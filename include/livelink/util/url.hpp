#pragma once

#include <string>

namespace livelink::util {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};

    bool secure() const { return scheme == "https" || scheme == "wss"; }

    // Value for a Host header: the port is omitted when it is the scheme default.
    std::string host_header() const;
};

// Accepts http, https, ws and wss URLs. Throws std::invalid_argument otherwise.
Url parse_url(const std::string& text);

// Appends the push subscription path ("/sub") unless the URL already ends with it.
std::string with_subscription_path(std::string url);

}  // namespace livelink::util
