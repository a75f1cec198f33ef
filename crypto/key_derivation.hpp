#pragma once

#include "algorithms.hpp"

#include <vector>

namespace krbmic {

// RFC 3961 DK(base_key, constant) for the AES enctypes, via OpenSSL's
// KRB5KDF. We do NOT reimplement n-fold or DR; we only orchestrate the
// library call. Throws Error(EncodingFailure) when base_key does not have
// aes_key_length(strength) bytes or the KDF fails.
std::vector<std::uint8_t> derive_key(const std::vector<std::uint8_t> &base_key,
                                     const std::vector<std::uint8_t> &constant,
                                     AesStrength strength);

// usage (4 bytes big-endian) || 0x99, the checksum key constant.
std::vector<std::uint8_t> checksum_key_constant(std::int32_t key_usage);

} // namespace krbmic
