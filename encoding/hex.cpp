#include "hex.hpp"

#include "../errors/error.hpp"

namespace krbmic {

std::string to_hex(const std::vector<std::uint8_t> &data) {
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(hex[(b >> 4) & 0x0F]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> from_hex(const std::string &hex) {
    if (hex.size() % 2 != 0) {
        throw Error(ErrorKind::InvalidParameter, "hex string has odd length");
    }
    auto nybble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        throw Error(ErrorKind::InvalidParameter, std::string("invalid hex digit '") + c + "'");
    };
    std::vector<std::uint8_t> out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = nybble(hex[2 * i]);
        int lo = nybble(hex[2 * i + 1]);
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace krbmic
