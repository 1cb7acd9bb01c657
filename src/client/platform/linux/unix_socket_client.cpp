#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <string_view>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump() + "\n";
    std::string_view rest = msg;
    // Chunk uploads are larger than one socket buffer
    while (!rest.empty()) {
        ssize_t sent = ::send(fd_, rest.data(), rest.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        rest.remove_prefix(static_cast<size_t>(sent));
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return false;

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    auto pos = buf_.find('\n');
    while (pos == std::string::npos) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[65536];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) return false;

        size_t scan_from = buf_.size();
        buf_.append(tmp, static_cast<size_t>(n));
        pos = buf_.find('\n', scan_from);
    }

    std::string line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    try {
        response = nlohmann::json::parse(line);
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed response: {}", e.what());
        return false;
    }
}

void UnixSocketClient::close() {
    buf_.clear();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
