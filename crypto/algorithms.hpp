#pragma once

#include <cstddef>
#include <cstdint>

namespace krbmic {

// AES variant of the negotiated Kerberos enctype. Only the key length
// differs; both produce a 12-byte hmac-sha1-96 checksum.
enum class AesStrength {
    Aes128,
    Aes256
};

// Kerberos enctype numbers (RFC 3962).
constexpr std::int32_t ETYPE_AES128_CTS_HMAC_SHA1_96 = 17;
constexpr std::int32_t ETYPE_AES256_CTS_HMAC_SHA1_96 = 18;

// GSS-API Kerberos key usages (RFC 4121 section 2).
constexpr std::int32_t KG_USAGE_ACCEPTOR_SEAL = 22;
constexpr std::int32_t KG_USAGE_ACCEPTOR_SIGN = 23;
constexpr std::int32_t KG_USAGE_INITIATOR_SEAL = 24;
constexpr std::int32_t KG_USAGE_INITIATOR_SIGN = 25;

constexpr std::size_t AES_SHA1_CHECKSUM_SIZE = 12;

inline std::size_t aes_key_length(AesStrength strength) {
    return strength == AesStrength::Aes128 ? 16 : 32;
}

const char *aes_strength_to_string(AesStrength strength);

} // namespace krbmic
