#include "delivery/serial_delivery_context.hpp"

#include <print>

SerialDeliveryContext::SerialDeliveryContext()
    : worker_([this](std::stop_token st) { worker_loop(st); }) {}

SerialDeliveryContext::~SerialDeliveryContext() {
    stop();
}

void SerialDeliveryContext::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) {
            std::println(stderr, "delivery: task posted after stop, dropped");
            return;
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void SerialDeliveryContext::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

bool SerialDeliveryContext::on_worker_thread() const {
    return worker_.get_id() == std::this_thread::get_id();
}

void SerialDeliveryContext::worker_loop(std::stop_token st) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, st, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Stop requested and nothing left to run
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}
