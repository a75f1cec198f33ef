#pragma once

#include "../errors/error.hpp"

#include <string>

namespace krbmic {

class AuditLogger {
public:
    explicit AuditLogger(const std::string &log_path);

    // Writes a single JSON line with type and payload (already JSON) embedded.
    // Best effort: a failed write is reported on stderr and otherwise ignored.
    void log_event(const std::string &event_type, const std::string &payload_json) const;

    // "security_failure" record for MessageAltered / DecryptFailure.
    void log_security_failure(const std::string &operation, const Error &err) const;

private:
    std::string log_path_;
};

} // namespace krbmic
