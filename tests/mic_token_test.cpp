#include "encoding/hex.hpp"
#include "gss/mech_list.hpp"
#include "gss/mic_token.hpp"

#include "test_util.hpp"

using namespace krbmic;
using krbmic::testing::error_kind_of;

TEST(MechList, EncodesMsKrb5ThenKrb5) {
    EXPECT_EQ("3016"
              "06092a864882f712010202"
              "06092a864886f712010202",
              to_hex(encode_mech_list()));
}

TEST(MicToken, InitiatorHeaderLayout) {
    MicToken token = make_initiator_mic_token(0x0102030405060708ull);
    EXPECT_TRUE(is_initiator_token(token));
    EXPECT_EQ("040404ffffffffff0102030405060708", to_hex(mic_token_header(token)));
}

TEST(MicToken, AcceptorTokenHasSentByAcceptorFlag) {
    MicToken token = make_acceptor_mic_token(1);
    EXPECT_FALSE(is_initiator_token(token));
    EXPECT_EQ("040405ffffffffff0000000000000001", to_hex(mic_token_header(token)));
}

TEST(MicToken, EncodeAppendsChecksumAfterHeader) {
    MicToken token = make_initiator_mic_token(42);
    token.checksum = std::vector<std::uint8_t>(12, 0x5A);

    std::vector<std::uint8_t> raw = encode_mic_token(token);
    ASSERT_EQ(MIC_HEADER_SIZE + 12, raw.size());
    EXPECT_EQ(mic_token_header(token), std::vector<std::uint8_t>(raw.begin(), raw.begin() + MIC_HEADER_SIZE));

    MicToken decoded = decode_mic_token(raw);
    EXPECT_EQ(token.flags, decoded.flags);
    EXPECT_EQ(42u, decoded.seq_number);
    EXPECT_EQ(token.checksum, decoded.checksum);
}

TEST(MicToken, RefusesToEncodeWithoutChecksum) {
    MicToken token = make_initiator_mic_token(7);
    EXPECT_EQ(ErrorKind::EncodingFailure, error_kind_of([&] { encode_mic_token(token); }));
}

TEST(MicToken, DecodesMaximumSequenceNumber) {
    std::vector<std::uint8_t> raw = from_hex("040404ffffffffffffffffffffffffff" "0102030405060708090a0b0c");
    MicToken token = decode_mic_token(raw);
    EXPECT_EQ(0xFFFFFFFFFFFFFFFFull, token.seq_number);
    EXPECT_EQ(12u, token.checksum.size());
}

TEST(MicToken, RejectsMalformedTokens) {
    const std::string checksum = "0102030405060708090a0b0c";
    const std::vector<std::string> bad = {
        "",
        "0404",
        "040404ffffffffff0000000000000001",          // header only
        "050404ffffffffff0000000000000001" + checksum, // wrap token id
        "040504ffffffffff0000000000000001" + checksum,
        "040404ffffff00ff0000000000000001" + checksum, // filler
    };
    for (const auto &hex : bad) {
        EXPECT_EQ(ErrorKind::TokenDecodeFailure, error_kind_of([&] { decode_mic_token(from_hex(hex)); }))
            << hex;
    }
}
