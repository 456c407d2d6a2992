#pragma once

#include "delivery/delivery_context.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

// Runs posted tasks on one dedicated worker thread.
class SerialDeliveryContext : public DeliveryContext {
public:
    SerialDeliveryContext();
    ~SerialDeliveryContext() override;

    SerialDeliveryContext(const SerialDeliveryContext&) = delete;
    SerialDeliveryContext& operator=(const SerialDeliveryContext&) = delete;

    void post(Task task) override;

    // Runs everything already queued, then joins the worker. Later posts are
    // dropped. Must not be called from inside a task.
    void stop();

    bool on_worker_thread() const;

private:
    void worker_loop(std::stop_token st);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> queue_;
    bool stopped_ = false;
    std::jthread worker_;
};
