#include "error.hpp"

namespace krbmic {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidParameter: return "InvalidParameter";
    case ErrorKind::EncodingFailure: return "EncodingFailure";
    case ErrorKind::TokenDecodeFailure: return "TokenDecodeFailure";
    case ErrorKind::DecryptFailure: return "DecryptFailure";
    case ErrorKind::MessageAltered: return "MessageAltered";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

bool Error::is_security_failure() const noexcept {
    return kind_ == ErrorKind::MessageAltered || kind_ == ErrorKind::DecryptFailure;
}

} // namespace krbmic
