#pragma once

#include <optional>
#include <string>

namespace krbmic {

struct ServicePrincipalName {
    std::string service_class; // e.g. "HTTP"
    std::string instance;      // usually the host name
};

// Splits "<service-class>/<instance>" on the first '/'. Both parts must be
// non-empty; no case or whitespace normalisation is done. Throws
// Error(InvalidParameter) otherwise.
ServicePrincipalName parse_target_name(const std::string &target_name);

// Returns the host name or throws Error(InvalidParameter) when absent.
std::string unwrap_hostname(const std::optional<std::string> &hostname);

} // namespace krbmic
