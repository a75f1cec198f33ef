#include "interfaces.hpp"
#include "factories.hpp"
#include "key_derivation.hpp"

#include "../errors/error.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace krbmic {

const char *aes_strength_to_string(AesStrength strength) {
    switch (strength) {
    case AesStrength::Aes128: return "aes128";
    case AesStrength::Aes256: return "aes256";
    }
    return "aes256";
}

namespace {

class AesSha1ChecksumProvider : public ChecksumProvider {
public:
    std::size_t checksum_size() const override { return AES_SHA1_CHECKSUM_SIZE; }

    std::vector<std::uint8_t> checksum(
        const std::vector<std::uint8_t> &key,
        std::int32_t key_usage,
        const std::vector<std::uint8_t> &data,
        AesStrength strength) override {
        // Kc = DK(base-key, usage | 0x99)
        const std::vector<std::uint8_t> kc =
            derive_key(key, checksum_key_constant(key_usage), strength);

        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int mac_len = 0;
        if (!HMAC(EVP_sha1(), kc.data(), static_cast<int>(kc.size()),
                  data.data(), data.size(), mac, &mac_len) ||
            mac_len < AES_SHA1_CHECKSUM_SIZE) {
            throw Error(ErrorKind::EncodingFailure, "HMAC-SHA1 failed");
        }

        // hmac-sha1-96: truncate to the leftmost 96 bits.
        return std::vector<std::uint8_t>(mac, mac + AES_SHA1_CHECKSUM_SIZE);
    }
};

} // namespace

std::unique_ptr<ChecksumProvider> make_aes_sha1_checksum_provider() {
    return std::make_unique<AesSha1ChecksumProvider>();
}

} // namespace krbmic
