#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace livelink::api {

constexpr const char* kSignatureMethod = "HMAC-SHA256";
constexpr const char* kSignatureVersion = "1.0";

struct SignedHeaders {
    std::string access_key_id;
    std::string content_md5;
    std::string signature_method{kSignatureMethod};
    std::string nonce;
    std::string signature_version{kSignatureVersion};
    std::string timestamp;
    std::string authorization;

    // Header name/value pairs in the order they are sent.
    std::vector<std::pair<std::string, std::string>> fields() const;
};

class RequestSigner {
public:
    RequestSigner(std::string access_key, std::string access_secret);

    SignedHeaders sign(std::string_view body) const;
    SignedHeaders sign(std::string_view body, std::string nonce, std::int64_t timestamp) const;

    static std::string canonical_string(const SignedHeaders& headers);

private:
    std::string access_key_;
    std::string access_secret_;
};

std::string md5_hex(std::string_view data);
std::string hmac_sha256_hex(std::string_view key, std::string_view data);
std::string generate_nonce();

}  // namespace livelink::api
