#include "mic.hpp"

#include "mech_list.hpp"
#include "mic_token.hpp"

#include "../crypto/factories.hpp"
#include "../errors/error.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace krbmic {

namespace {

ChecksumProvider &default_checksum_provider() {
    // Stateless, so one instance serves concurrent callers.
    static const std::unique_ptr<ChecksumProvider> provider =
        make_aes_sha1_checksum_provider();
    return *provider;
}

bool checksums_equal(const std::vector<std::uint8_t> &a,
                     const std::vector<std::uint8_t> &b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

void validate_mic_token(const std::vector<std::uint8_t> &raw_token,
                        std::int32_t key_usage,
                        const EncryptionParams &params,
                        ChecksumProvider &provider) {
    const MicToken token = decode_mic_token(raw_token);

    // The sub-session key always wins over the session key.
    const std::vector<std::uint8_t> key = params.require_key();

    std::vector<std::uint8_t> payload = encode_mech_list();
    const std::vector<std::uint8_t> header = mic_token_header(token);
    payload.insert(payload.end(), header.begin(), header.end());

    const std::vector<std::uint8_t> expected = provider.checksum(
        key, key_usage, payload, params.effective_aes_strength());

    if (!checksums_equal(expected, token.checksum)) {
        throw Error(ErrorKind::MessageAltered, "bad checksum of the mic token");
    }
}

void validate_mic_token(const std::vector<std::uint8_t> &raw_token,
                        std::int32_t key_usage,
                        const EncryptionParams &params) {
    validate_mic_token(raw_token, key_usage, params, default_checksum_provider());
}

std::vector<std::uint8_t> generate_initiator_mic(std::vector<std::uint8_t> payload,
                                                 std::uint64_t seq_number,
                                                 const std::vector<std::uint8_t> &session_key,
                                                 ChecksumProvider &provider) {
    MicToken token = make_initiator_mic_token(seq_number);

    const std::vector<std::uint8_t> header = mic_token_header(token);
    payload.insert(payload.end(), header.begin(), header.end());

    token.checksum = provider.checksum(
        session_key, KG_USAGE_INITIATOR_SIGN, payload, AesStrength::Aes256);

    return encode_mic_token(token);
}

std::vector<std::uint8_t> generate_initiator_mic(std::vector<std::uint8_t> payload,
                                                 std::uint64_t seq_number,
                                                 const std::vector<std::uint8_t> &session_key) {
    return generate_initiator_mic(std::move(payload), seq_number, session_key,
                                  default_checksum_provider());
}

} // namespace krbmic
