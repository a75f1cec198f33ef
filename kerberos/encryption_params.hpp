#pragma once

#include "../crypto/algorithms.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace krbmic {

enum class KeySource {
    SubSessionKey,
    SessionKey,
    None
};

const char *key_source_to_string(KeySource source);

struct ResolvedKey {
    KeySource source;
    std::vector<std::uint8_t> key; // empty when source == KeySource::None
};

// Key material negotiated for one security context. The owning context
// replaces sub_session_key when the acceptor sends a new subkey; a
// verify/generate call treats the struct as an immutable snapshot.
struct EncryptionParams {
    std::optional<AesStrength> aes_strength;
    std::optional<std::vector<std::uint8_t>> session_key;
    std::optional<std::vector<std::uint8_t>> sub_session_key;

    // Configured strength, Aes256 when none was negotiated.
    AesStrength effective_aes_strength() const;

    // Sub-session key first, then session key. Never falls back past a
    // present sub-session key.
    ResolvedKey resolve_key() const;

    // resolve_key(), or Error(DecryptFailure) when neither key is present.
    std::vector<std::uint8_t> require_key() const;

    // Records the AES strength of a negotiated enctype (17 or 18).
    void set_encryption_type(std::int32_t etype);
};

AesStrength aes_strength_from_etype(std::int32_t etype);

} // namespace krbmic
