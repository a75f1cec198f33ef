#include "audit_logger.hpp"

#include "../service/json_line.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace krbmic {

AuditLogger::AuditLogger(const std::string &log_path) : log_path_(log_path) {}

void AuditLogger::log_event(const std::string &event_type, const std::string &payload_json) const {
    namespace fs = std::filesystem;

    fs::path p(log_path_);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "audit: cannot create " << p.parent_path() << ": " << ec.message() << '\n';
            return;
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "audit: cannot open " << log_path_ << '\n';
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    out << "{"
        << "\"ts\":" << secs << ","
        << "\"event\":\"" << json_escape(event_type) << "\",";
    // payload_json is assumed to be valid JSON object or value
    out << "\"payload\":" << payload_json;
    out << "}" << '\n';
}

void AuditLogger::log_security_failure(const std::string &operation, const Error &err) const {
    std::string payload = "{";
    payload += "\"operation\":\"" + json_escape(operation) + "\",";
    payload += "\"error\":\"" + std::string(error_kind_to_string(err.kind())) + "\",";
    payload += "\"message\":\"" + json_escape(err.what()) + "\"";
    payload += "}";
    log_event("security_failure", payload);
}

} // namespace krbmic
