#pragma once

#include "../encoding/der.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace krbmic {

constexpr std::size_t FRAME_HEADER_SIZE = 4;

// Kerberos over TCP (RFC 4120 7.2.2): the high bit of the length is reserved.
constexpr std::uint32_t FRAME_RESERVED_BIT = 0x80000000u;

void write_frame_length(std::uint32_t length, std::uint8_t *header);
std::uint32_t read_frame_length(const std::uint8_t *header);

// [4-byte big-endian body length][body]
std::vector<std::uint8_t> frame_message(const std::vector<std::uint8_t> &body);

// DER-encodes message with an OpenSSL i2d_* encoder directly after a 4-byte
// length header. Throws Error(EncodingFailure) when the encoder rejects the
// value; nothing is returned in that case.
template <typename T>
std::vector<std::uint8_t> serialize_message(const T *message,
                                            int (*i2d)(const T *, unsigned char **)) {
    std::vector<std::uint8_t> data = der_encode(message, i2d, FRAME_HEADER_SIZE);
    write_frame_length(static_cast<std::uint32_t>(data.size() - FRAME_HEADER_SIZE),
                       data.data());
    return data;
}

// Removes one complete frame from the front of a stream buffer and returns
// its body. Returns nullopt, leaving the buffer untouched, until the whole
// frame has arrived. Throws Error(EncodingFailure) when the length uses the
// reserved bit or exceeds max_length.
std::optional<std::vector<std::uint8_t>> take_frame(std::vector<std::uint8_t> &buffer,
                                                    std::uint32_t max_length);

} // namespace krbmic
