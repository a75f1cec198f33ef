#pragma once

#include <stdexcept>
#include <string>

namespace krbmic {

// Closed set of failure kinds. Callers branch on kind(), never on what().
enum class ErrorKind {
    InvalidParameter,
    EncodingFailure,
    TokenDecodeFailure,
    DecryptFailure,
    MessageAltered
};

const char *error_kind_to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string &message);

    ErrorKind kind() const noexcept { return kind_; }

    // MessageAltered and DecryptFailure must abort the authentication attempt.
    bool is_security_failure() const noexcept;

private:
    ErrorKind kind_;
};

} // namespace krbmic
