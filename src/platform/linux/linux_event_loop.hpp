#pragma once

#include "delivery/delivery_context.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

// epoll-driven delivery context. Tasks posted from any thread are queued and
// the loop is woken through an eventfd; they run on the thread inside run().
// SIGINT and SIGTERM arrive through a signalfd and go to the signal handler.
class LinuxEventLoop : public DeliveryContext {
public:
    using SignalHandler = std::function<void(int signo)>;

    explicit LinuxEventLoop(bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    void post(Task task) override;

    // Without a handler, a signal stops the loop.
    void set_signal_handler(SignalHandler handler) { signal_handler_ = std::move(handler); }

private:
    void wake();
    void run_pending();
    void log(const std::string& msg);

    bool verbose_;
    SignalHandler signal_handler_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int task_event_fd_ = -1;

    std::mutex mutex_;
    std::deque<Task> tasks_;

    std::atomic<bool> running_{false};
};
