#include "encoding/hex.hpp"
#include "gss/mech_list.hpp"
#include "service/json_line.hpp"
#include "service/mic_service.hpp"

#include "test_util.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace krbmic;
using krbmic::testing::error_kind_of;
using krbmic::testing::key_of;

namespace {

class MicServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("krbmic_service_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        cfg_.socket_path = (dir_ / "krbmicd.sock").string();
        cfg_.log_path = (dir_ / "audit" / "audit.log").string();
        cfg_.max_frame_length = 1024;
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string dispatch(const std::string &line) {
        AuditLogger audit(cfg_.log_path);
        return dispatch_request_line(line, cfg_, audit);
    }

    std::string audit_log() const {
        std::ifstream in(cfg_.log_path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path dir_;
    Config cfg_;
};

std::string field(const std::string &json, const std::string &key) {
    return extract_json_string(json, key).value_or("<missing>");
}

} // namespace

TEST_F(MicServiceTest, ParsesTargetName) {
    const std::string reply = dispatch(R"({"kind":"PARSE_SPN","target":"HTTP/www.example.com"})");
    EXPECT_EQ("OK", field(reply, "status"));
    EXPECT_EQ("HTTP", field(reply, "service_class"));
    EXPECT_EQ("www.example.com", field(reply, "instance"));
}

TEST_F(MicServiceTest, MalformedTargetNameIsDenied) {
    const std::string reply = dispatch(R"({"kind":"PARSE_SPN","target":"HTTP/"})");
    EXPECT_EQ("DENIED", field(reply, "status"));
    EXPECT_EQ("InvalidParameter", field(reply, "error"));
}

TEST_F(MicServiceTest, SignThenVerifyWithSubSessionKey) {
    const std::string key = to_hex(key_of(32, 6));
    const std::string sign = dispatch(R"({"kind":"SIGN","payload":")" + to_hex(encode_mech_list()) +
                                      R"(","seq":"17","key":")" + key + R"("})");
    ASSERT_EQ("OK", field(sign, "status")) << sign;
    const std::string token = field(sign, "token");

    const std::string verify = dispatch(R"({"kind":"VERIFY","token":")" + token +
                                        R"(","key_usage":"25","session_key":")" + to_hex(key_of(32, 1)) +
                                        R"(","sub_session_key":")" + key + R"(","etype":"18"})");
    EXPECT_EQ("OK", field(verify, "status")) << verify;
    EXPECT_EQ("sub_session_key", field(verify, "key_source"));
}

TEST_F(MicServiceTest, TamperedTokenIsDeniedAndAudited) {
    const std::string key = to_hex(key_of(32, 6));
    const std::string sign = dispatch(R"({"kind":"SIGN","payload":")" + to_hex(encode_mech_list()) +
                                      R"(","seq":"1","key":")" + key + R"("})");
    std::string token = field(sign, "token");
    token.back() = token.back() == '0' ? '1' : '0';

    const std::string verify = dispatch(R"({"kind":"VERIFY","token":")" + token +
                                        R"(","key_usage":"25","session_key":")" + key + R"("})");
    EXPECT_EQ("DENIED", field(verify, "status"));
    EXPECT_EQ("MessageAltered", field(verify, "error"));

    const std::string log = audit_log();
    EXPECT_NE(std::string::npos, log.find("\"event\":\"security_failure\""));
    EXPECT_NE(std::string::npos, log.find("\"operation\":\"VERIFY\""));
    EXPECT_EQ(std::string::npos, log.find(key)) << "key material must not reach the audit log";
}

TEST_F(MicServiceTest, VerifyWithoutKeysIsDecryptFailure) {
    const std::string sign = dispatch(R"({"kind":"SIGN","payload":"00","seq":"1","key":")" +
                                      to_hex(key_of(32, 6)) + R"("})");
    const std::string verify = dispatch(R"({"kind":"VERIFY","token":")" + field(sign, "token") +
                                        R"(","key_usage":"25"})");
    EXPECT_EQ("DecryptFailure", field(verify, "error"));
    EXPECT_NE(std::string::npos, audit_log().find("DecryptFailure"));
}

TEST_F(MicServiceTest, OrdinaryFailuresAreNotAudited) {
    const std::string reply = dispatch(R"({"kind":"VERIFY","token":"0404","key_usage":"25"})");
    EXPECT_EQ("TokenDecodeFailure", field(reply, "error"));
    EXPECT_FALSE(std::filesystem::exists(cfg_.log_path));
}

TEST_F(MicServiceTest, RejectsMalformedFields) {
    EXPECT_EQ("InvalidParameter",
              field(dispatch(R"({"kind":"SIGN","payload":"0","seq":"1","key":"00"})"), "error"));
    EXPECT_EQ("InvalidParameter",
              field(dispatch(R"({"kind":"SIGN","payload":"00","seq":"-1","key":"00"})"), "error"));
    EXPECT_EQ("InvalidParameter",
              field(dispatch(R"({"kind":"SIGN","payload":"00","key":"00"})"), "error"));
    for (const char *seq : {" -1", " 1", "+1", "-0"}) {
        EXPECT_EQ("InvalidParameter",
                  field(dispatch(std::string(R"({"kind":"SIGN","payload":"00","seq":")") + seq +
                                 R"(","key":"00"})"), "error"))
            << "seq \"" << seq << "\"";
    }
    EXPECT_EQ("InvalidParameter",
              field(dispatch(R"({"kind":"VERIFY","token":"00","key_usage":"x25"})"), "error"));
    EXPECT_EQ("InvalidParameter",
              field(dispatch(R"({"kind":"VERIFY","token":"00","key_usage":"25","etype":"23"})"), "error"));
}

TEST_F(MicServiceTest, FrameAndUnframe) {
    const std::string framed = dispatch(R"({"kind":"FRAME","body":"a1b2c3"})");
    EXPECT_EQ("00000003a1b2c3", field(framed, "frame"));

    const std::string unframed = dispatch(R"({"kind":"UNFRAME","frame":"00000003a1b2c3"})");
    EXPECT_EQ("a1b2c3", field(unframed, "body"));

    EXPECT_EQ("EncodingFailure", field(dispatch(R"({"kind":"UNFRAME","frame":"00000004a1b2c3"})"), "error"));
    EXPECT_EQ("EncodingFailure", field(dispatch(R"({"kind":"UNFRAME","frame":"00000001a1b2"})"), "error"));
    EXPECT_EQ("EncodingFailure", field(dispatch(R"({"kind":"UNFRAME","frame":"00000800"})"), "error"));
}

TEST_F(MicServiceTest, UnknownKind) {
    EXPECT_EQ("unknown_kind", field(dispatch(R"({"kind":"WRAP"})"), "error"));
}

TEST(JsonLine, EscapesControlCharacters) {
    EXPECT_EQ(R"(a\"b\\c\n\u0001)", json_escape(std::string("a\"b\\c\n\x01")));
}
