#pragma once

#include <cstdint>
#include <string>

namespace krbmic {

struct Config {
    std::string socket_path;
    std::string log_path;
    std::uint32_t max_frame_length;
};

// Defaults, then /etc/krbmic/krbmicd.conf when present, then the
// KRBMICD_SOCKET / KRBMICD_AUDIT_LOG environment variables.
Config load_config_or_default();

// Applies "key = value" lines from path onto cfg. Blank lines and lines
// starting with '#' are skipped. Throws Error(InvalidParameter) on an
// unreadable file, an unknown key or a malformed value.
void load_config_file(const std::string &path, Config &cfg);

} // namespace krbmic
