#include "livelink/api/request_signer.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <stdexcept>

namespace livelink::api {

namespace {

std::string to_hex(const unsigned char* data, std::size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[(data[i] >> 4U) & 0x0FU]);
        out.push_back(kDigits[data[i] & 0x0FU]);
    }
    return out;
}

}  // namespace

std::vector<std::pair<std::string, std::string>> SignedHeaders::fields() const {
    return {
        {"x-bili-accesskeyid", access_key_id},
        {"x-bili-content-md5", content_md5},
        {"x-bili-signature-method", signature_method},
        {"x-bili-signature-nonce", nonce},
        {"x-bili-signature-version", signature_version},
        {"x-bili-timestamp", timestamp},
        {"Authorization", authorization},
    };
}

RequestSigner::RequestSigner(std::string access_key, std::string access_secret)
    : access_key_(std::move(access_key)), access_secret_(std::move(access_secret)) {}

SignedHeaders RequestSigner::sign(std::string_view body) const {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return sign(body, generate_nonce(), static_cast<std::int64_t>(seconds));
}

SignedHeaders RequestSigner::sign(std::string_view body, std::string nonce, std::int64_t timestamp) const {
    SignedHeaders headers;
    headers.access_key_id = access_key_;
    headers.content_md5 = md5_hex(body);
    headers.nonce = std::move(nonce);
    headers.timestamp = std::to_string(timestamp);
    headers.authorization = hmac_sha256_hex(access_secret_, canonical_string(headers));
    return headers;
}

std::string RequestSigner::canonical_string(const SignedHeaders& headers) {
    // Field order and key names are part of the upstream signature contract.
    return "x-bili-accesskeyid:" + headers.access_key_id + "\n" +
           "x-bili-content-md5:" + headers.content_md5 + "\n" +
           "x-bili-signature-method:" + headers.signature_method + "\n" +
           "x-bili-signature-nonce:" + headers.nonce + "\n" +
           "x-bili-signature-version:" + headers.signature_version + "\n" +
           "x-bili-timestamp:" + headers.timestamp;
}

std::string md5_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    return to_hex(digest, digest_len);
}

std::string hmac_sha256_hex(std::string_view key, std::string_view data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(),
             key.data(),
             static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()),
             data.size(),
             mac,
             &mac_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return to_hex(mac, mac_len);
}

std::string generate_nonce() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

}  // namespace livelink::api
