#pragma once

#include "../crypto/interfaces.hpp"
#include "../kerberos/encryption_params.hpp"

#include <cstdint>
#include <vector>

namespace krbmic {

// Verifies a peer's MIC token against the negotiated mechanism list.
//
// The key comes from params.resolve_key() (sub-session key over session key)
// and the AES strength from params.effective_aes_strength(). The checksum
// input is DER(mech list) || token header.
//
// Throws Error with:
//   TokenDecodeFailure  raw_token is not a MIC token
//   DecryptFailure      params holds no key
//   MessageAltered      checksum mismatch; the caller must abort the handshake
void validate_mic_token(const std::vector<std::uint8_t> &raw_token,
                        std::int32_t key_usage,
                        const EncryptionParams &params,
                        ChecksumProvider &provider);

void validate_mic_token(const std::vector<std::uint8_t> &raw_token,
                        std::int32_t key_usage,
                        const EncryptionParams &params);

// Builds an initiator MIC token over payload || token header.
//
// Outbound tokens are always signed with KG_USAGE_INITIATOR_SIGN and
// Aes256, whatever EncryptionParams records for inbound verification.
// Never returns a token without a checksum.
std::vector<std::uint8_t> generate_initiator_mic(std::vector<std::uint8_t> payload,
                                                 std::uint64_t seq_number,
                                                 const std::vector<std::uint8_t> &session_key,
                                                 ChecksumProvider &provider);

std::vector<std::uint8_t> generate_initiator_mic(std::vector<std::uint8_t> payload,
                                                 std::uint64_t seq_number,
                                                 const std::vector<std::uint8_t> &session_key);

} // namespace krbmic
