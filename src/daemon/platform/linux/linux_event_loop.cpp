#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      core_(config_, verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (reclaim_timer_fd_ >= 0) ::close(reclaim_timer_fd_);
}

bool LinuxEventLoop::init() {
    // Block the signals before any worker thread exists so they all inherit the mask
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (stores, provider, workers)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    reclaim_timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (reclaim_timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    time_t interval = static_cast<time_t>(config_.upload.reclaim_interval_minutes) * 60;
    if (interval <= 0) interval = 60;
    itimerspec spec{.it_interval = {.tv_sec = interval, .tv_nsec = 0},
                    .it_value = {.tv_sec = interval, .tv_nsec = 0}};
    if (timerfd_settime(reclaim_timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(reclaim_timer_fd_, EPOLLIN))
        return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info))
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0)
                        ipc_server_.close_client(client_fd);
                }
                continue;
            }

            if (fd == reclaim_timer_fd_) {
                uint64_t expirations;
                if (::read(reclaim_timer_fd_, &expirations, sizeof(expirations)) > 0) {
                    int expired = core_.reclaim();
                    if (expired > 0) log(std::format("expired {} upload session(s)", expired));
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Workers stop at their next segment or stage boundary
    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::handle_client(int fd) {
    // A single read may carry several pipelined commands
    nlohmann::json cmd;
    while (true) {
        switch (ipc_server_.read_command(fd, cmd)) {
            case ReadStatus::Message: {
                std::string cmd_str = cmd["cmd"].get<std::string>();
                auto response = core_.handle_command(cmd_str, cmd);
                if (!ipc_server_.send_response(fd, response)) {
                    drop_client(fd);
                    return;
                }
                cmd = nlohmann::json();
                continue;
            }
            case ReadStatus::Pending:
                return;
            case ReadStatus::Malformed:
                ipc_server_.send_response(fd, {{"status", "error"},
                                               {"code", "INVALID_REQUEST"},
                                               {"message", "malformed command"}});
                drop_client(fd);
                return;
            case ReadStatus::Closed:
                drop_client(fd);
                return;
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
