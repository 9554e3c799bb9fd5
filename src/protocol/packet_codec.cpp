#include "livelink/protocol/packet_codec.hpp"

#include "livelink/errors.hpp"

#include <zlib.h>

#include <array>
#include <string>

namespace livelink::protocol {

namespace {

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> static_cast<unsigned>(shift)) & 0xFFU));
    }
}

std::uint16_t read_u16(std::span<const std::uint8_t> data, std::size_t offset) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[offset]) << 8U) | data[offset + 1]);
}

std::uint32_t read_u32(std::span<const std::uint8_t> data, std::size_t offset) {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8U) | data[offset + i];
    }
    return value;
}

// Inflated bytes are charged against one budget for the whole decode call,
// across sibling frames and nesting levels alike.
struct DecodeState {
    const DecodeLimits& limits;
    std::size_t inflated_bytes{0};
    std::vector<Frame>& frames;
};

void decode_into(std::span<const std::uint8_t> data, std::size_t depth, DecodeState& state) {
    const auto& limits = state.limits;
    std::size_t offset = 0;
    while (data.size() - offset >= kHeaderLength) {
        const std::uint32_t total_len = read_u32(data, offset);
        if (total_len == 0 || total_len > data.size() - offset) {
            break;
        }

        const std::uint16_t header_len = read_u16(data, offset + 4);
        if (header_len < kHeaderLength || header_len > total_len) {
            throw ProtocolError("Invalid frame header length " + std::to_string(header_len) +
                                " for frame of " + std::to_string(total_len) + " bytes");
        }

        Frame frame;
        frame.total_len = total_len;
        frame.header_len = header_len;
        frame.version = read_u16(data, offset + 6);
        frame.operation = read_u32(data, offset + 8);
        frame.sequence = read_u32(data, offset + 12);

        const auto body = data.subspan(offset + header_len, total_len - header_len);
        if (frame.version == kVersionZlib) {
            if (depth + 1 > limits.max_depth) {
                throw ProtocolError("Compressed frame nesting exceeds depth " +
                                    std::to_string(limits.max_depth));
            }
            if (state.inflated_bytes >= limits.max_decompressed_bytes) {
                throw ProtocolError("Inflated frame bodies exceed " +
                                    std::to_string(limits.max_decompressed_bytes) + " bytes");
            }
            const auto inflated = inflate(body, limits.max_decompressed_bytes - state.inflated_bytes);
            state.inflated_bytes += inflated.size();
            decode_into(inflated, depth + 1, state);
        } else {
            frame.body.assign(body.begin(), body.end());
            state.frames.push_back(std::move(frame));
        }

        offset += total_len;
    }
}

}  // namespace

std::vector<std::uint8_t> encode(std::uint32_t operation, std::span<const std::uint8_t> body) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(kHeaderLength + body.size());
    put_u32(buffer, static_cast<std::uint32_t>(kHeaderLength + body.size()));
    put_u16(buffer, kHeaderLength);
    put_u16(buffer, kVersionPlain);
    put_u32(buffer, operation);
    put_u32(buffer, 1);
    buffer.insert(buffer.end(), body.begin(), body.end());
    return buffer;
}

std::vector<std::uint8_t> encode(Operation operation, std::span<const std::uint8_t> body) {
    return encode(static_cast<std::uint32_t>(operation), body);
}

std::vector<Frame> decode(std::span<const std::uint8_t> data, const DecodeLimits& limits) {
    std::vector<Frame> frames;
    DecodeState state{limits, 0, frames};
    decode_into(data, 0, state);
    return frames;
}

std::vector<std::uint8_t> inflate(std::span<const std::uint8_t> compressed, std::size_t max_output) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw ProtocolError("inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::vector<std::uint8_t> output;
    std::array<std::uint8_t, 16 * 1024> chunk{};
    int ret = Z_OK;
    do {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        ret = ::inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            const std::string reason = stream.msg ? stream.msg : "code " + std::to_string(ret);
            inflateEnd(&stream);
            throw ProtocolError("Failed to inflate frame body: " + reason);
        }

        const std::size_t produced = chunk.size() - stream.avail_out;
        if (output.size() + produced > max_output) {
            inflateEnd(&stream);
            throw ProtocolError("Inflated frame body exceeds " + std::to_string(max_output) + " bytes");
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_OK && stream.avail_in == 0 && produced == 0) {
            inflateEnd(&stream);
            throw ProtocolError("Truncated zlib stream in frame body");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return output;
}

const char* operation_name(std::uint32_t operation) {
    switch (static_cast<Operation>(operation)) {
    case Operation::Heartbeat:
        return "HEARTBEAT";
    case Operation::HeartbeatReply:
        return "HEARTBEAT_REPLY";
    case Operation::SendEvent:
        return "SEND_EVENT";
    case Operation::Auth:
        return "AUTH";
    case Operation::AuthReply:
        return "AUTH_REPLY";
    }
    return "UNKNOWN";
}

}  // namespace livelink::protocol
