#pragma once

#include "../audit/audit_logger.hpp"
#include "../kerberos/encryption_params.hpp"
#include "../policy/config.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace krbmic {

struct SignRequest {
    std::vector<std::uint8_t> payload;
    std::uint64_t seq_number;
    std::vector<std::uint8_t> session_key;
};

struct VerifyRequest {
    std::vector<std::uint8_t> token;
    std::int32_t key_usage;
    EncryptionParams params;
};

struct ServiceResponse {
    std::string kind;
    std::string status; // "OK" or "DENIED"
    std::string error;  // error_kind_to_string() when DENIED
    std::vector<std::pair<std::string, std::string>> fields;
};

// All parse_* functions throw Error(InvalidParameter) naming the missing or
// malformed field.
SignRequest parse_sign_request_json(const std::string &json);
VerifyRequest parse_verify_request_json(const std::string &json);

ServiceResponse handle_parse_spn_request(const std::string &json);
ServiceResponse handle_sign_request(const SignRequest &req);
ServiceResponse handle_verify_request(const VerifyRequest &req);
ServiceResponse handle_frame_request(const std::string &json);
ServiceResponse handle_unframe_request(const std::string &json, std::uint32_t max_frame_length);

std::string service_response_to_json(const ServiceResponse &resp);

// Routes one request line by its "kind" and always returns a reply line
// (without the trailing newline). Failures become DENIED replies; security
// failures are additionally written to the audit log.
std::string dispatch_request_line(const std::string &line,
                                  const Config &cfg,
                                  const AuditLogger &audit);

} // namespace krbmic
