#include "mic_token.hpp"

#include "../errors/error.hpp"

#include <string>

namespace krbmic {

MicToken make_initiator_mic_token(std::uint64_t seq_number) {
    return MicToken{MIC_INITIATOR_DEFAULT_FLAGS, seq_number, {}};
}

MicToken make_acceptor_mic_token(std::uint64_t seq_number) {
    return MicToken{MIC_ACCEPTOR_DEFAULT_FLAGS, seq_number, {}};
}

std::vector<std::uint8_t> mic_token_header(const MicToken &token) {
    std::vector<std::uint8_t> header;
    header.reserve(MIC_HEADER_SIZE);
    header.push_back(MIC_TOKEN_ID[0]);
    header.push_back(MIC_TOKEN_ID[1]);
    header.push_back(token.flags);
    header.insert(header.end(), MIC_FILLER_SIZE, MIC_FILLER_BYTE);
    for (int shift = 56; shift >= 0; shift -= 8) {
        header.push_back(static_cast<std::uint8_t>((token.seq_number >> shift) & 0xFF));
    }
    return header;
}

std::vector<std::uint8_t> encode_mic_token(const MicToken &token) {
    if (token.checksum.empty()) {
        throw Error(ErrorKind::EncodingFailure, "MIC token has no checksum");
    }

    std::vector<std::uint8_t> raw = mic_token_header(token);
    raw.insert(raw.end(), token.checksum.begin(), token.checksum.end());
    return raw;
}

MicToken decode_mic_token(const std::vector<std::uint8_t> &raw) {
    if (raw.size() <= MIC_HEADER_SIZE) {
        throw Error(ErrorKind::TokenDecodeFailure,
                    "MIC token too short: " + std::to_string(raw.size()) + " bytes");
    }
    if (raw[0] != MIC_TOKEN_ID[0] || raw[1] != MIC_TOKEN_ID[1]) {
        throw Error(ErrorKind::TokenDecodeFailure, "MIC token has invalid TOK_ID");
    }
    for (std::size_t i = 3; i < 3 + MIC_FILLER_SIZE; ++i) {
        if (raw[i] != MIC_FILLER_BYTE) {
            throw Error(ErrorKind::TokenDecodeFailure, "MIC token has invalid filler");
        }
    }

    MicToken token;
    token.flags = raw[2];
    token.seq_number = 0;
    for (std::size_t i = 8; i < MIC_HEADER_SIZE; ++i) {
        token.seq_number = (token.seq_number << 8) | raw[i];
    }
    token.checksum.assign(raw.begin() + MIC_HEADER_SIZE, raw.end());
    return token;
}

} // namespace krbmic
