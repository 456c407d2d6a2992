#include "callback_bridge.hpp"

#include "segment.hpp"
#include "session_controller.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace {

struct Registry {
    std::mutex mutex;
    std::unordered_map<CallbackBridge::Handle, std::shared_ptr<SessionController>> entries;
    CallbackBridge::Handle next = 1; // 0 is never handed out
};

Registry& registry() {
    static Registry r;
    return r;
}

} // namespace

CallbackBridge::Handle CallbackBridge::register_controller(std::shared_ptr<SessionController> controller) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    Handle handle = r.next++;
    r.entries.emplace(handle, std::move(controller));
    return handle;
}

std::shared_ptr<SessionController> CallbackBridge::lookup(Handle handle) {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    auto it = r.entries.find(handle);
    if (it == r.entries.end()) return nullptr;
    return it->second;
}

void CallbackBridge::unregister(Handle handle) {
    std::shared_ptr<SessionController> released;
    auto& r = registry();
    {
        std::lock_guard lock(r.mutex);
        auto it = r.entries.find(handle);
        if (it == r.entries.end()) return;
        released = std::move(it->second);
        r.entries.erase(it);
    }
    // released drops outside the lock; it may be the last reference.
}

size_t CallbackBridge::registered_count() {
    auto& r = registry();
    std::lock_guard lock(r.mutex);
    return r.entries.size();
}

void CallbackBridge::install(DecodeParams& params, Handle handle) {
    params.continue_callback = &CallbackBridge::continue_check;
    params.continue_user_data = to_user_data(handle);
    params.new_segment_callback = &CallbackBridge::new_segments;
    params.new_segment_user_data = to_user_data(handle);
}

bool CallbackBridge::continue_check(void* user_data) {
    auto controller = lookup(from_user_data(user_data));
    if (!controller) return true;
    return controller->should_continue();
}

void CallbackBridge::new_segments(int n_new, void* user_data) {
    auto controller = lookup(from_user_data(user_data));
    if (!controller) return;

    auto observer = controller->observer();
    if (!observer) return;

    const Engine& engine = *controller->engine_;
    int count = engine.segment_count();
    int start_index = std::max(0, count - n_new);
    auto segments = read_segments(engine, start_index, count);

    auto frames = controller->frame_count();
    if (frames && !segments.empty()) {
        // Not clamped: segment timing can run past the buffer or move backwards.
        double total_ms = static_cast<double>(*frames) * 1000.0 / ENGINE_SAMPLE_RATE;
        double progress = static_cast<double>(segments.back().end_ms) / total_ms;
        controller->delivery_->post([observer, progress] {
            observer->on_progress(progress);
        });
    }

    controller->delivery_->post([observer, segments = std::move(segments), start_index] {
        observer->on_new_segments(segments, start_index);
    });
}

void* CallbackBridge::to_user_data(Handle handle) {
    return reinterpret_cast<void*>(static_cast<uintptr_t>(handle));
}

CallbackBridge::Handle CallbackBridge::from_user_data(void* user_data) {
    return static_cast<Handle>(reinterpret_cast<uintptr_t>(user_data));
}
