#include "mic_service.hpp"

#include "json_line.hpp"

#include "../encoding/hex.hpp"
#include "../errors/error.hpp"
#include "../gss/mic.hpp"
#include "../kerberos/framing.hpp"
#include "../kerberos/target_name.hpp"

#include <sstream>
#include <stdexcept>

namespace krbmic {

namespace {

std::string require_field(const std::string &json, const std::string &key) {
    std::optional<std::string> value = extract_json_string(json, key);
    if (!value) {
        throw Error(ErrorKind::InvalidParameter, "missing field: " + key);
    }
    return *value;
}

std::vector<std::uint8_t> require_hex_field(const std::string &json, const std::string &key) {
    const std::string value = require_field(json, key);
    try {
        return from_hex(value);
    } catch (const Error &err) {
        throw Error(ErrorKind::InvalidParameter, key + ": " + err.what());
    }
}

template <typename Parse>
auto parse_number_field(const std::string &json, const std::string &key, Parse parse)
    -> decltype(parse(std::string(), static_cast<std::size_t *>(nullptr))) {
    const std::string value = require_field(json, key);
    // std::sto* skip leading whitespace and accept a sign; only plain digits
    // are valid here.
    if (value.empty() || value[0] < '0' || value[0] > '9') {
        throw Error(ErrorKind::InvalidParameter, key + ": not a number: '" + value + "'");
    }
    try {
        std::size_t used = 0;
        auto n = parse(value, &used);
        if (used == value.size()) {
            return n;
        }
    } catch (const std::logic_error &) {
        // reported below with the field name
    }
    throw Error(ErrorKind::InvalidParameter, key + ": not a number: '" + value + "'");
}

ServiceResponse ok_response(const std::string &kind) {
    ServiceResponse resp;
    resp.kind = kind;
    resp.status = "OK";
    return resp;
}

} // namespace

SignRequest parse_sign_request_json(const std::string &json) {
    SignRequest req;
    req.payload = require_hex_field(json, "payload");
    req.session_key = require_hex_field(json, "key");
    req.seq_number = parse_number_field(json, "seq", [](const std::string &s, std::size_t *used) {
        return static_cast<std::uint64_t>(std::stoull(s, used));
    });
    return req;
}

VerifyRequest parse_verify_request_json(const std::string &json) {
    VerifyRequest req;
    req.token = require_hex_field(json, "token");
    req.key_usage = parse_number_field(json, "key_usage", [](const std::string &s, std::size_t *used) {
        return static_cast<std::int32_t>(std::stoi(s, used));
    });

    if (extract_json_string(json, "session_key")) {
        req.params.session_key = require_hex_field(json, "session_key");
    }
    if (extract_json_string(json, "sub_session_key")) {
        req.params.sub_session_key = require_hex_field(json, "sub_session_key");
    }
    if (extract_json_string(json, "etype")) {
        req.params.set_encryption_type(parse_number_field(json, "etype", [](const std::string &s, std::size_t *used) {
            return static_cast<std::int32_t>(std::stoi(s, used));
        }));
    }
    return req;
}

ServiceResponse handle_parse_spn_request(const std::string &json) {
    const ServicePrincipalName spn = parse_target_name(require_field(json, "target"));

    ServiceResponse resp = ok_response("PARSE_SPN");
    resp.fields.emplace_back("service_class", spn.service_class);
    resp.fields.emplace_back("instance", spn.instance);
    return resp;
}

ServiceResponse handle_sign_request(const SignRequest &req) {
    ServiceResponse resp = ok_response("SIGN");
    resp.fields.emplace_back(
        "token", to_hex(generate_initiator_mic(req.payload, req.seq_number, req.session_key)));
    return resp;
}

ServiceResponse handle_verify_request(const VerifyRequest &req) {
    validate_mic_token(req.token, req.key_usage, req.params);

    ServiceResponse resp = ok_response("VERIFY");
    resp.fields.emplace_back("key_source", key_source_to_string(req.params.resolve_key().source));
    return resp;
}

ServiceResponse handle_frame_request(const std::string &json) {
    ServiceResponse resp = ok_response("FRAME");
    resp.fields.emplace_back("frame", to_hex(frame_message(require_hex_field(json, "body"))));
    return resp;
}

ServiceResponse handle_unframe_request(const std::string &json, std::uint32_t max_frame_length) {
    std::vector<std::uint8_t> buffer = require_hex_field(json, "frame");

    std::optional<std::vector<std::uint8_t>> body = take_frame(buffer, max_frame_length);
    if (!body) {
        throw Error(ErrorKind::EncodingFailure, "frame is truncated");
    }
    if (!buffer.empty()) {
        throw Error(ErrorKind::EncodingFailure,
                    std::to_string(buffer.size()) + " trailing bytes after frame");
    }

    ServiceResponse resp = ok_response("UNFRAME");
    resp.fields.emplace_back("body", to_hex(*body));
    return resp;
}

std::string service_response_to_json(const ServiceResponse &resp) {
    std::ostringstream oss;
    oss << "{"
        << "\"kind\":\"" << json_escape(resp.kind) << "\","
        << "\"status\":\"" << resp.status << "\"";
    if (!resp.error.empty()) {
        oss << ",\"error\":\"" << json_escape(resp.error) << "\"";
    }
    for (const auto &field : resp.fields) {
        oss << ",\"" << json_escape(field.first) << "\":\"" << json_escape(field.second) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string dispatch_request_line(const std::string &line,
                                  const Config &cfg,
                                  const AuditLogger &audit) {
    std::string kind = extract_json_string(line, "kind").value_or("");

    try {
        if (kind == "PARSE_SPN") {
            return service_response_to_json(handle_parse_spn_request(line));
        } else if (kind == "SIGN") {
            return service_response_to_json(handle_sign_request(parse_sign_request_json(line)));
        } else if (kind == "VERIFY") {
            return service_response_to_json(handle_verify_request(parse_verify_request_json(line)));
        } else if (kind == "FRAME") {
            return service_response_to_json(handle_frame_request(line));
        } else if (kind == "UNFRAME") {
            return service_response_to_json(handle_unframe_request(line, cfg.max_frame_length));
        }
    } catch (const Error &err) {
        if (err.is_security_failure()) {
            audit.log_security_failure(kind, err);
        }
        ServiceResponse resp;
        resp.kind = kind;
        resp.status = "DENIED";
        resp.error = error_kind_to_string(err.kind());
        resp.fields.emplace_back("message", err.what());
        return service_response_to_json(resp);
    }

    ServiceResponse resp;
    resp.kind = kind;
    resp.status = "DENIED";
    resp.error = "unknown_kind";
    return service_response_to_json(resp);
}

} // namespace krbmic
