#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(bool verbose) : verbose_(verbose) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (task_event_fd_ >= 0) ::close(task_event_fd_);
}

bool LinuxEventLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Task queue notification eventfd
    task_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (task_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(task_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 8;
    epoll_event events[MAX_EVENTS];

    // Tasks posted before run() started
    run_pending();

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
                if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) continue;
                int signo = static_cast<int>(info.ssi_signo);
                log(std::string("Received signal ") + strsignal(signo));
                if (signal_handler_) {
                    signal_handler_(signo);
                } else {
                    running_.store(false, std::memory_order_release);
                }
                continue;
            }

            if (fd == task_event_fd_) {
                uint64_t val;
                if (::read(task_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                run_pending();
                continue;
            }
        }
    }

    // Run whatever was queued before the stop so no notification is lost
    run_pending();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    wake();
}

void LinuxEventLoop::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    wake();
}

void LinuxEventLoop::wake() {
    if (task_event_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(task_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        task();
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-session] {}", msg);
    }
}
