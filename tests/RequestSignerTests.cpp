#include <catch2/catch_test_macros.hpp>

#include "livelink/api/request_signer.hpp"

#include <set>
#include <string>

using namespace livelink::api;

TEST_CASE("md5_hex matches known digests", "[signer]") {
    REQUIRE(md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE("hmac_sha256_hex matches RFC 4231 test case 2", "[signer]") {
    REQUIRE(hmac_sha256_hex("Jefe", "what do ya want for nothing?") ==
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("sign builds the canonical string in header order", "[signer]") {
    RequestSigner signer("key-id", "secret");
    const std::string body = R"({"app_id":1,"code":"abc"})";
    const auto headers = signer.sign(body, "nonce-1", 1700000000);

    REQUIRE(headers.access_key_id == "key-id");
    REQUIRE(headers.content_md5 == md5_hex(body));
    REQUIRE(headers.signature_method == "HMAC-SHA256");
    REQUIRE(headers.signature_version == "1.0");
    REQUIRE(headers.timestamp == "1700000000");

    const auto canonical = RequestSigner::canonical_string(headers);
    REQUIRE(canonical == "x-bili-accesskeyid:key-id\n"
                         "x-bili-content-md5:" + md5_hex(body) + "\n"
                         "x-bili-signature-method:HMAC-SHA256\n"
                         "x-bili-signature-nonce:nonce-1\n"
                         "x-bili-signature-version:1.0\n"
                         "x-bili-timestamp:1700000000");
    REQUIRE(headers.authorization == hmac_sha256_hex("secret", canonical));
    REQUIRE(headers.authorization.size() == 64);
}

TEST_CASE("signature depends on secret and body", "[signer]") {
    const auto a = RequestSigner("key", "secret-a").sign("{}", "n", 1);
    const auto b = RequestSigner("key", "secret-b").sign("{}", "n", 1);
    const auto c = RequestSigner("key", "secret-a").sign("{ }", "n", 1);

    REQUIRE(a.authorization != b.authorization);
    REQUIRE(a.authorization != c.authorization);
}

TEST_CASE("fields lists every signed header plus Authorization", "[signer]") {
    const auto headers = RequestSigner("key", "secret").sign("{}");
    const auto fields = headers.fields();

    REQUIRE(fields.size() == 7);
    REQUIRE(fields.front().first == "x-bili-accesskeyid");
    REQUIRE(fields.back().first == "Authorization");
    REQUIRE(fields.back().second == headers.authorization);
}

TEST_CASE("generate_nonce yields distinct UUID strings", "[signer]") {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        const auto nonce = generate_nonce();
        REQUIRE(nonce.size() == 36);
        REQUIRE(nonce[14] == '4');
        seen.insert(nonce);
    }
    REQUIRE(seen.size() == 32);
}
