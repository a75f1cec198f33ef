#include "target_name.hpp"

#include "../errors/error.hpp"

namespace krbmic {

ServicePrincipalName parse_target_name(const std::string &target_name) {
    const std::size_t divider = target_name.find('/');
    if (divider == std::string::npos) {
        throw Error(ErrorKind::InvalidParameter,
                    "invalid service principal name: missing '/'");
    }
    if (divider == 0) {
        throw Error(ErrorKind::InvalidParameter,
                    "invalid service principal name: empty service class");
    }
    if (divider == target_name.size() - 1) {
        throw Error(ErrorKind::InvalidParameter,
                    "invalid service principal name: empty instance");
    }

    ServicePrincipalName spn;
    spn.service_class = target_name.substr(0, divider);
    spn.instance = target_name.substr(divider + 1);
    return spn;
}

std::string unwrap_hostname(const std::optional<std::string> &hostname) {
    if (!hostname) {
        throw Error(ErrorKind::InvalidParameter, "hostname is not provided");
    }
    return *hostname;
}

} // namespace krbmic
