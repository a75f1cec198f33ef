#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace krbmic {

// GSS-API Kerberos MIC token, RFC 4121 section 4.2.6.1:
//   04 04 | flags | ff ff ff ff ff | SND_SEQ (8, big-endian) | SGN_CKSUM
constexpr std::uint8_t MIC_TOKEN_ID[2] = {0x04, 0x04};
constexpr std::uint8_t MIC_FILLER_BYTE = 0xFF;
constexpr std::size_t MIC_FILLER_SIZE = 5;
constexpr std::size_t MIC_HEADER_SIZE = 16;

constexpr std::uint8_t MIC_FLAG_SENT_BY_ACCEPTOR = 0x01;
constexpr std::uint8_t MIC_FLAG_ACCEPTOR_SUBKEY = 0x04;

constexpr std::uint8_t MIC_INITIATOR_DEFAULT_FLAGS = MIC_FLAG_ACCEPTOR_SUBKEY;
constexpr std::uint8_t MIC_ACCEPTOR_DEFAULT_FLAGS =
    MIC_FLAG_ACCEPTOR_SUBKEY | MIC_FLAG_SENT_BY_ACCEPTOR;

struct MicToken {
    std::uint8_t flags;
    std::uint64_t seq_number;
    std::vector<std::uint8_t> checksum; // empty until signed
};

MicToken make_initiator_mic_token(std::uint64_t seq_number);
MicToken make_acceptor_mic_token(std::uint64_t seq_number);

inline bool is_initiator_token(const MicToken &token) {
    return (token.flags & MIC_FLAG_SENT_BY_ACCEPTOR) == 0;
}

// Every field except the checksum, in wire form. This is what gets signed.
std::vector<std::uint8_t> mic_token_header(const MicToken &token);

// Throws Error(EncodingFailure) when the checksum has not been set.
std::vector<std::uint8_t> encode_mic_token(const MicToken &token);

// Throws Error(TokenDecodeFailure) on a short token, wrong TOK_ID, wrong
// filler or an empty checksum field.
MicToken decode_mic_token(const std::vector<std::uint8_t> &raw);

} // namespace krbmic
