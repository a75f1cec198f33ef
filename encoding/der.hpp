#pragma once

#include "../errors/error.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace krbmic {

// Runs an OpenSSL i2d_* encoder twice (size, then write) and returns the DER
// bytes preceded by `headroom` zero bytes. Throws Error(EncodingFailure) when
// the encoder rejects the value.
template <typename T>
std::vector<std::uint8_t> der_encode(const T *value,
                                     int (*i2d)(const T *, unsigned char **),
                                     std::size_t headroom = 0) {
    if (!value) {
        throw Error(ErrorKind::EncodingFailure, "cannot DER-encode a null value");
    }

    const int der_len = i2d(value, nullptr);
    if (der_len <= 0) {
        throw Error(ErrorKind::EncodingFailure, "DER encoding failed");
    }

    std::vector<std::uint8_t> out(headroom + static_cast<std::size_t>(der_len));
    unsigned char *p = out.data() + headroom;
    if (i2d(value, &p) != der_len) {
        throw Error(ErrorKind::EncodingFailure, "DER encoder wrote an unexpected length");
    }
    return out;
}

} // namespace krbmic
