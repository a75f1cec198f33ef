#include "framing.hpp"

#include <limits>
#include <string>

namespace krbmic {

void write_frame_length(std::uint32_t length, std::uint8_t *header) {
    header[0] = static_cast<std::uint8_t>((length >> 24) & 0xFF);
    header[1] = static_cast<std::uint8_t>((length >> 16) & 0xFF);
    header[2] = static_cast<std::uint8_t>((length >> 8) & 0xFF);
    header[3] = static_cast<std::uint8_t>(length & 0xFF);
}

std::uint32_t read_frame_length(const std::uint8_t *header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

std::vector<std::uint8_t> frame_message(const std::vector<std::uint8_t> &body) {
    if (body.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw Error(ErrorKind::EncodingFailure, "message body too large to frame");
    }

    std::vector<std::uint8_t> data(FRAME_HEADER_SIZE);
    data.reserve(FRAME_HEADER_SIZE + body.size());
    write_frame_length(static_cast<std::uint32_t>(body.size()), data.data());
    data.insert(data.end(), body.begin(), body.end());
    return data;
}

std::optional<std::vector<std::uint8_t>> take_frame(std::vector<std::uint8_t> &buffer,
                                                    std::uint32_t max_length) {
    if (buffer.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    const std::uint32_t length = read_frame_length(buffer.data());
    if (length & FRAME_RESERVED_BIT) {
        throw Error(ErrorKind::EncodingFailure, "frame length uses the reserved high bit");
    }
    if (length > max_length) {
        throw Error(ErrorKind::EncodingFailure,
                    "frame length " + std::to_string(length) +
                    " exceeds limit " + std::to_string(max_length));
    }
    if (buffer.size() - FRAME_HEADER_SIZE < length) {
        return std::nullopt;
    }

    const auto body_begin = buffer.begin() + FRAME_HEADER_SIZE;
    const auto body_end = body_begin + length;
    std::vector<std::uint8_t> body(body_begin, body_end);
    buffer.erase(buffer.begin(), body_end);
    return body;
}

} // namespace krbmic
