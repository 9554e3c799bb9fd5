#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace livelink::protocol {

constexpr std::uint16_t kHeaderLength = 16;
constexpr std::uint16_t kVersionPlain = 1;
constexpr std::uint16_t kVersionZlib = 2;

enum class Operation : std::uint32_t {
    Heartbeat = 2,
    HeartbeatReply = 3,
    SendEvent = 5,
    Auth = 7,
    AuthReply = 8,
};

struct Frame {
    std::uint32_t total_len{0};
    std::uint16_t header_len{kHeaderLength};
    std::uint16_t version{kVersionPlain};
    std::uint32_t operation{0};
    std::uint32_t sequence{0};
    std::vector<std::uint8_t> body;

    bool is(Operation op) const { return operation == static_cast<std::uint32_t>(op); }
};

struct DecodeLimits {
    std::size_t max_depth{4};
    // Total inflated bytes allowed for one decode() call.
    std::size_t max_decompressed_bytes{16 * 1024 * 1024};
};

std::vector<std::uint8_t> encode(std::uint32_t operation, std::span<const std::uint8_t> body);
std::vector<std::uint8_t> encode(Operation operation, std::span<const std::uint8_t> body);

/**
 * Splits a socket message into frames. A trailing incomplete frame, a zero
 * length or fewer than 16 remaining bytes end the scan without error.
 * Version 2 bodies are inflated and their nested frames are flattened into the
 * result. Throws ProtocolError on a bad header length, an inflate failure or
 * when the configured limits are exceeded.
 */
std::vector<Frame> decode(std::span<const std::uint8_t> data, const DecodeLimits& limits = {});

std::vector<std::uint8_t> inflate(std::span<const std::uint8_t> compressed, std::size_t max_output);

const char* operation_name(std::uint32_t operation);

}  // namespace livelink::protocol
