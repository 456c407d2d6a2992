#pragma once

#include "engine/engine.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

class SessionController;

// Routes native engine callbacks back to the controller that started the run.
//
// The engine only carries an opaque void* between registration and callback.
// Instead of a raw controller address, that pointer holds an integer handle
// into a process-wide registry. The registry entry owns a strong reference,
// so the controller cannot be destroyed while the engine may still call back.
// The entry is released once the blocking engine call has returned.
class CallbackBridge {
public:
    using Handle = uint64_t;

    static Handle register_controller(std::shared_ptr<SessionController> controller);
    static std::shared_ptr<SessionController> lookup(Handle handle);
    static void unregister(Handle handle);
    static size_t registered_count();

    // Points both callback slots of the bundle at the controller behind handle.
    static void install(DecodeParams& params, Handle handle);

    // Continuation check: false once a cancellation is pending.
    static bool continue_check(void* user_data);

    // New-segment notification: converts segments [count - n_new, count),
    // estimates progress and forwards both to the delivery context.
    static void new_segments(int n_new, void* user_data);

    static void* to_user_data(Handle handle);
    static Handle from_user_data(void* user_data);
};
