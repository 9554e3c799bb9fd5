#include "livelink/util/url.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace livelink::util {

namespace {

constexpr const char* kSubscriptionPath = "/sub";

std::string default_port(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") {
        return "443";
    }
    return "80";
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string Url::host_header() const {
    std::string value = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!port.empty() && port != default_port(scheme)) {
        value += ":" + port;
    }
    return value;
}

Url parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("URL is missing a scheme: " + text);
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (url.scheme != "http" && url.scheme != "https" && url.scheme != "ws" && url.scheme != "wss") {
        throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find_first_of("/?", authority_begin);
    const std::string authority = text.substr(authority_begin, path_begin - authority_begin);
    if (authority.empty()) {
        throw std::invalid_argument("URL is missing a host: " + text);
    }

    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in URL: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            url.port = authority.substr(close + 2);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
    }
    if (url.host.empty()) {
        throw std::invalid_argument("URL is missing a host: " + text);
    }
    if (url.port.empty()) {
        url.port = default_port(url.scheme);
    }

    if (path_begin != std::string::npos) {
        url.target = text.substr(path_begin);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }
    return url;
}

std::string with_subscription_path(std::string url) {
    if (ends_with(url, kSubscriptionPath)) {
        return url;
    }
    if (!url.empty() && url.back() == '/') {
        url.append(kSubscriptionPath + 1);
    } else {
        url.append(kSubscriptionPath);
    }
    return url;
}

}  // namespace livelink::util
