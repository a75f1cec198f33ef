#include "key_derivation.hpp"

#include "../errors/error.hpp"

#include <openssl/core_names.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <string>

namespace krbmic {

std::vector<std::uint8_t> derive_key(const std::vector<std::uint8_t> &base_key,
                                     const std::vector<std::uint8_t> &constant,
                                     AesStrength strength) {
    const std::size_t key_len = aes_key_length(strength);
    if (base_key.size() != key_len) {
        throw Error(ErrorKind::EncodingFailure,
                    std::string("key length ") + std::to_string(base_key.size()) +
                    " does not match " + aes_strength_to_string(strength));
    }

    // KRB5KDF uses CBC-CTS with a zero IV, which is what DR specifies.
    std::string cipher = strength == AesStrength::Aes128 ? "AES-128-CBC" : "AES-256-CBC";

    EVP_KDF *kdf = EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_KRB5KDF, nullptr);
    if (!kdf) {
        throw Error(ErrorKind::EncodingFailure, "EVP_KDF_fetch(KRB5KDF) failed");
    }
    EVP_KDF_CTX *kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!kctx) {
        throw Error(ErrorKind::EncodingFailure, "EVP_KDF_CTX_new failed");
    }

    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_CIPHER, &cipher[0], 0),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY,
                                          const_cast<std::uint8_t *>(base_key.data()),
                                          base_key.size()),
        OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_CONSTANT,
                                          const_cast<std::uint8_t *>(constant.data()),
                                          constant.size()),
        OSSL_PARAM_construct_end()
    };

    std::vector<std::uint8_t> derived(key_len);
    if (EVP_KDF_derive(kctx, derived.data(), derived.size(), params) <= 0) {
        EVP_KDF_CTX_free(kctx);
        throw Error(ErrorKind::EncodingFailure, "KRB5KDF derive failed");
    }

    EVP_KDF_CTX_free(kctx);
    return derived;
}

std::vector<std::uint8_t> checksum_key_constant(std::int32_t key_usage) {
    const auto usage = static_cast<std::uint32_t>(key_usage);
    return {
        static_cast<std::uint8_t>((usage >> 24) & 0xFF),
        static_cast<std::uint8_t>((usage >> 16) & 0xFF),
        static_cast<std::uint8_t>((usage >> 8) & 0xFF),
        static_cast<std::uint8_t>(usage & 0xFF),
        0x99
    };
}

} // namespace krbmic
