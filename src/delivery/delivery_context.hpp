#pragma once

#include <functional>

// Serialization point for every observer and completion notification.
// Tasks posted from any thread run one at a time, in posting order.
class DeliveryContext {
public:
    using Task = std::function<void()>;

    virtual ~DeliveryContext() = default;
    virtual void post(Task task) = 0;
};
