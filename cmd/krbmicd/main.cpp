#include "../../audit/audit_logger.hpp"
#include "../../errors/error.hpp"
#include "../../policy/config.hpp"
#include "../../service/json_line.hpp"
#include "../../service/mic_service.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <string>

namespace {

volatile std::sig_atomic_t g_terminate = 0;

void handle_signal(int) {
    g_terminate = 1;
}

bool write_all(int fd, const std::string &data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    using namespace krbmic;

    Config cfg;
    try {
        cfg = load_config_or_default();
        if (argc > 1) {
            load_config_file(argv[1], cfg);
        }
    } catch (const Error &err) {
        std::cerr << "krbmicd: " << err.what() << std::endl;
        return 1;
    }
    AuditLogger audit(cfg.log_path);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::perror("socket");
        return 1;
    }

    ::unlink(cfg.socket_path.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (cfg.socket_path.size() >= sizeof(addr.sun_path)) {
        std::cerr << "krbmicd: socket path too long: " << cfg.socket_path << std::endl;
        ::close(server_fd);
        return 1;
    }
    std::strncpy(addr.sun_path, cfg.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 16) < 0) {
        std::perror("listen");
        ::close(server_fd);
        return 1;
    }

    std::cout << "krbmicd listening on UNIX socket: " << cfg.socket_path << std::endl;
    audit.log_event("startup", "{\"socket\":\"" + json_escape(cfg.socket_path) + "\"}");

    while (!g_terminate) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR && g_terminate) {
                break;
            }
            std::perror("accept");
            continue;
        }

        std::string buffer;
        char chunk[1024];
        ssize_t n;
        bool client_ok = true;
        while (client_ok && (n = ::read(client_fd, chunk, sizeof(chunk))) > 0) {
            buffer.append(chunk, chunk + n);
            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);

                if (line.empty()) continue;

                audit.log_event("request",
                                "{\"kind\":\"" +
                                json_escape(extract_json_string(line, "kind").value_or("")) +
                                "\"}");

                std::string response_json;
                try {
                    response_json = dispatch_request_line(line, cfg, audit);
                } catch (const std::exception &ex) {
                    response_json = std::string("{\"status\":\"DENIED\",\"error\":\"") +
                                    json_escape(ex.what()) + "\"}";
                }

                response_json.push_back('\n');
                if (!write_all(client_fd, response_json)) {
                    std::perror("write");
                    client_ok = false;
                    break;
                }
            }
        }

        ::close(client_fd);
    }

    ::close(server_fd);
    ::unlink(cfg.socket_path.c_str());

    return 0;
}
