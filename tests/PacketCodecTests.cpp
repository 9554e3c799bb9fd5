#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "livelink/errors.hpp"
#include "livelink/protocol/packet_codec.hpp"

#include <zlib.h>

#include <string>
#include <vector>

using namespace livelink;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> deflate_bytes(const std::vector<std::uint8_t>& input) {
    uLongf size = compressBound(static_cast<uLong>(input.size()));
    std::vector<std::uint8_t> out(size);
    REQUIRE(compress(out.data(), &size, input.data(), static_cast<uLong>(input.size())) == Z_OK);
    out.resize(size);
    return out;
}

// Wraps `inner` in a version 2 (zlib) frame.
std::vector<std::uint8_t> compressed_frame(const std::vector<std::uint8_t>& inner) {
    auto frame = protocol::encode(protocol::Operation::SendEvent, deflate_bytes(inner));
    frame[7] = static_cast<std::uint8_t>(protocol::kVersionZlib);
    return frame;
}

void append(std::vector<std::uint8_t>& out, const std::vector<std::uint8_t>& more) {
    out.insert(out.end(), more.begin(), more.end());
}

}  // namespace

TEST_CASE("encode writes a big-endian 16 byte header", "[protocol]") {
    const auto body = bytes_of("hi");
    const auto frame = protocol::encode(protocol::Operation::Auth, body);

    REQUIRE(frame.size() == 18);
    const std::vector<std::uint8_t> header(frame.begin(), frame.begin() + 16);
    REQUIRE(header == std::vector<std::uint8_t>{0, 0, 0, 18, 0, 16, 0, 1, 0, 0, 0, 7, 0, 0, 0, 1});
    REQUIRE(frame[16] == 'h');
    REQUIRE(frame[17] == 'i');
}

TEST_CASE("heartbeat frame is a bare header", "[protocol]") {
    const auto frame = protocol::encode(protocol::Operation::Heartbeat, {});
    REQUIRE(frame.size() == protocol::kHeaderLength);

    const auto frames = protocol::decode(frame);
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].is(protocol::Operation::Heartbeat));
    REQUIRE(frames[0].body.empty());
}

TEST_CASE("decode returns the encoded operation and body as one plain frame", "[protocol]") {
    const std::uint32_t operation = GENERATE(2u, 5u, 7u, 0xFFFFFFFFu);
    const auto body = GENERATE(std::string{}, std::string("x"), std::string(4096, '\0'));

    const auto frames = protocol::decode(protocol::encode(operation, bytes_of(body)));
    REQUIRE(frames.size() == 1);
    REQUIRE(frames[0].operation == operation);
    REQUIRE(frames[0].version == protocol::kVersionPlain);
    REQUIRE(frames[0].body == bytes_of(body));
}

TEST_CASE("decode splits concatenated frames in order", "[protocol]") {
    auto data = protocol::encode(protocol::Operation::SendEvent, bytes_of(R"({"cmd":"A"})"));
    append(data, protocol::encode(protocol::Operation::HeartbeatReply, bytes_of("1234")));
    append(data, protocol::encode(99, bytes_of("x")));

    const auto frames = protocol::decode(data);
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0].is(protocol::Operation::SendEvent));
    REQUIRE(frames[0].body == bytes_of(R"({"cmd":"A"})"));
    REQUIRE(frames[1].is(protocol::Operation::HeartbeatReply));
    REQUIRE(frames[2].operation == 99);
    REQUIRE(frames[2].sequence == 1);
    REQUIRE(std::string(protocol::operation_name(frames[2].operation)) == "UNKNOWN");
}

TEST_CASE("decode stops quietly at incomplete or empty input", "[protocol]") {
    SECTION("fewer than 16 bytes") {
        REQUIRE(protocol::decode(std::vector<std::uint8_t>(10, 0xFF)).empty());
    }

    SECTION("trailing frame longer than the remaining data") {
        auto data = protocol::encode(protocol::Operation::SendEvent, bytes_of("first"));
        auto partial = protocol::encode(protocol::Operation::SendEvent, bytes_of("second frame body"));
        partial.resize(partial.size() - 4);
        append(data, partial);

        const auto frames = protocol::decode(data);
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].body == bytes_of("first"));
    }

    SECTION("zero total length") {
        std::vector<std::uint8_t> data(protocol::kHeaderLength, 0);
        REQUIRE(protocol::decode(data).empty());
    }
}

TEST_CASE("decode rejects an impossible header length", "[protocol]") {
    auto frame = protocol::encode(protocol::Operation::SendEvent, bytes_of("body"));

    SECTION("shorter than the fixed header") {
        frame[5] = 8;
        REQUIRE_THROWS_AS(protocol::decode(frame), ProtocolError);
    }

    SECTION("longer than the frame") {
        frame[5] = 200;
        REQUIRE_THROWS_AS(protocol::decode(frame), ProtocolError);
    }
}

TEST_CASE("version 2 frames are inflated and flattened", "[protocol][zlib]") {
    std::vector<std::uint8_t> inner;
    append(inner, protocol::encode(protocol::Operation::SendEvent, bytes_of(R"({"cmd":"A"})")));
    append(inner, protocol::encode(protocol::Operation::SendEvent, bytes_of(R"({"cmd":"B"})")));

    auto data = compressed_frame(inner);
    append(data, protocol::encode(protocol::Operation::HeartbeatReply, {}));

    const auto frames = protocol::decode(data);
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0].body == bytes_of(R"({"cmd":"A"})"));
    REQUIRE(frames[1].body == bytes_of(R"({"cmd":"B"})"));
    REQUIRE(frames[2].is(protocol::Operation::HeartbeatReply));
}

TEST_CASE("compressed frames are bounded", "[protocol][zlib]") {
    const auto leaf = protocol::encode(protocol::Operation::SendEvent, bytes_of(R"({"cmd":"A"})"));

    SECTION("nesting deeper than the limit") {
        const auto twice = compressed_frame(compressed_frame(leaf));
        protocol::DecodeLimits limits;
        limits.max_depth = 1;
        REQUIRE_THROWS_AS(protocol::decode(twice, limits), ProtocolError);

        limits.max_depth = 2;
        REQUIRE(protocol::decode(twice, limits).size() == 1);
    }

    SECTION("inflated size over the limit") {
        std::vector<std::uint8_t> big(64 * 1024, 'a');
        const auto frame = compressed_frame(protocol::encode(protocol::Operation::SendEvent, big));
        protocol::DecodeLimits limits;
        limits.max_decompressed_bytes = 1024;
        REQUIRE_THROWS_AS(protocol::decode(frame, limits), ProtocolError);
    }

    SECTION("inflated total across sibling frames") {
        const auto piece = compressed_frame(
            protocol::encode(protocol::Operation::SendEvent, std::vector<std::uint8_t>(64 * 1024, 'a')));
        std::vector<std::uint8_t> data;
        for (int i = 0; i < 4; ++i) {
            append(data, piece);
        }

        protocol::DecodeLimits limits;
        limits.max_decompressed_bytes = 200 * 1024;
        REQUIRE_THROWS_AS(protocol::decode(data, limits), ProtocolError);

        limits.max_decompressed_bytes = 300 * 1024;
        REQUIRE(protocol::decode(data, limits).size() == 4);
    }

    SECTION("inflated total across nesting levels") {
        const auto piece = compressed_frame(
            protocol::encode(protocol::Operation::SendEvent, std::vector<std::uint8_t>(64 * 1024, 'a')));
        std::vector<std::uint8_t> inner;
        for (int i = 0; i < 4; ++i) {
            append(inner, piece);
        }
        const auto outer = compressed_frame(inner);

        protocol::DecodeLimits limits;
        limits.max_decompressed_bytes = 200 * 1024;
        REQUIRE_THROWS_AS(protocol::decode(outer, limits), ProtocolError);
    }

    SECTION("corrupt zlib body") {
        auto frame = protocol::encode(protocol::Operation::SendEvent, bytes_of("definitely not zlib"));
        frame[7] = static_cast<std::uint8_t>(protocol::kVersionZlib);
        REQUIRE_THROWS_AS(protocol::decode(frame), ProtocolError);
    }
}
