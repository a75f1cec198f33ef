#include "config.hpp"

#include "../errors/error.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace krbmic {

namespace {

const char *const DEFAULT_CONFIG_PATH = "/etc/krbmic/krbmicd.conf";

std::string trim(const std::string &s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::uint32_t parse_frame_length(const std::string &value, const std::string &where) {
    try {
        std::size_t used = 0;
        unsigned long n = std::stoul(value, &used);
        if (used == value.size() && n > 0 && n < 0x80000000ul) {
            return static_cast<std::uint32_t>(n);
        }
    } catch (const std::logic_error &) {
        // falls through to the error below
    }
    throw Error(ErrorKind::InvalidParameter, where + ": invalid max_frame_length '" + value + "'");
}

} // namespace

void load_config_file(const std::string &path, Config &cfg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw Error(ErrorKind::InvalidParameter, "cannot read config file " + path);
    }

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const std::string where = path + ":" + std::to_string(lineno);
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw Error(ErrorKind::InvalidParameter, where + ": expected key = value");
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        if (value.empty()) {
            throw Error(ErrorKind::InvalidParameter, where + ": empty value for " + key);
        }

        if (key == "socket_path") {
            cfg.socket_path = value;
        } else if (key == "log_path") {
            cfg.log_path = value;
        } else if (key == "max_frame_length") {
            cfg.max_frame_length = parse_frame_length(value, where);
        } else {
            throw Error(ErrorKind::InvalidParameter, where + ": unknown key " + key);
        }
    }
}

Config load_config_or_default() {
    Config cfg;
    cfg.socket_path = "/run/krbmicd.sock";
    cfg.log_path = "/var/log/krbmic/audit.log";
    cfg.max_frame_length = 65536;

    if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
        load_config_file(DEFAULT_CONFIG_PATH, cfg);
    }

    if (const char *socket = std::getenv("KRBMICD_SOCKET")) {
        cfg.socket_path = socket;
    }
    if (const char *log = std::getenv("KRBMICD_AUDIT_LOG")) {
        cfg.log_path = log;
    }

    return cfg;
}

} // namespace krbmic
