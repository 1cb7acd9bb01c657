#include "platform/linux/unix_socket_server.hpp"

#include "config.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// Largest chunk, base64 encoded, plus room for the rest of the command
static_assert((Config::Upload::kMaxChunkSize + 2) / 3 * 4 + 64 * 1024 <=
              UnixSocketServer::kMaxLineBytes);

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    socket_path_ = endpoint;

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous recv may have buffered more than one line.
    auto pos = client->buf.find('\n');
    if (pos == std::string::npos) {
        char buf[65536];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return ReadStatus::Pending;
        }
        if (n <= 0) return ReadStatus::Closed;

        size_t scan_from = client->buf.size();
        client->buf.append(buf, static_cast<size_t>(n));
        if (client->buf.size() > kMaxLineBytes) {
            std::println(stderr, "ipc: client {} exceeded {} bytes without a newline",
                         client_fd, kMaxLineBytes);
            return ReadStatus::Closed;
        }

        pos = client->buf.find('\n', scan_from);
        if (pos == std::string::npos) return ReadStatus::Pending;
    }

    std::string line = client->buf.substr(0, pos);
    client->buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return ReadStatus::Malformed;
    }

    // Every command is an object naming itself in a string "cmd"
    auto name = cmd.is_object() ? cmd.find("cmd") : cmd.end();
    if (!cmd.is_object() || name == cmd.end() || !name->is_string()) {
        cmd = nlohmann::json();
        return ReadStatus::Malformed;
    }
    return ReadStatus::Message;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t sent = 0;

    // Client sockets are non-blocking; large payloads (rendered outputs) need several writes.
    while (sent < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, 5000) <= 0) return false;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
