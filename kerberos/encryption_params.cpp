#include "encryption_params.hpp"

#include "../errors/error.hpp"

#include <string>
#include <utility>

namespace krbmic {

const char *key_source_to_string(KeySource source) {
    switch (source) {
    case KeySource::SubSessionKey: return "sub_session_key";
    case KeySource::SessionKey: return "session_key";
    case KeySource::None: return "none";
    }
    return "none";
}

AesStrength aes_strength_from_etype(std::int32_t etype) {
    switch (etype) {
    case ETYPE_AES128_CTS_HMAC_SHA1_96: return AesStrength::Aes128;
    case ETYPE_AES256_CTS_HMAC_SHA1_96: return AesStrength::Aes256;
    default:
        throw Error(ErrorKind::InvalidParameter,
                    "unsupported encryption type: " + std::to_string(etype));
    }
}

AesStrength EncryptionParams::effective_aes_strength() const {
    return aes_strength.value_or(AesStrength::Aes256);
}

ResolvedKey EncryptionParams::resolve_key() const {
    if (sub_session_key) {
        return ResolvedKey{KeySource::SubSessionKey, *sub_session_key};
    }
    if (session_key) {
        return ResolvedKey{KeySource::SessionKey, *session_key};
    }
    return ResolvedKey{KeySource::None, {}};
}

std::vector<std::uint8_t> EncryptionParams::require_key() const {
    ResolvedKey resolved = resolve_key();
    if (resolved.source == KeySource::None) {
        throw Error(ErrorKind::DecryptFailure, "unable to obtain decryption key");
    }
    return std::move(resolved.key);
}

void EncryptionParams::set_encryption_type(std::int32_t etype) {
    aes_strength = aes_strength_from_etype(etype);
}

} // namespace krbmic
