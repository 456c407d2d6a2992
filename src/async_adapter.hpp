#pragma once

#include "session_controller.hpp"

#include <expected>
#include <future>
#include <memory>
#include <vector>

// Future-returning wrappers over SessionController. The futures are fulfilled
// on the delivery context, so never wait on them from that context's thread.
namespace async_session {

inline std::future<SessionController::TranscribeResult>
transcribe(SessionController& controller, std::vector<float> samples) {
    auto promise = std::make_shared<std::promise<SessionController::TranscribeResult>>();
    auto future = promise->get_future();

    auto accepted = controller.transcribe(std::move(samples),
        [promise](SessionController::TranscribeResult result) {
            promise->set_value(std::move(result));
        });
    if (!accepted) {
        promise->set_value(std::unexpected(accepted.error()));
    }
    return future;
}

inline std::future<std::expected<void, TranscriptionError>>
cancel(SessionController& controller) {
    auto promise = std::make_shared<std::promise<std::expected<void, TranscriptionError>>>();
    auto future = promise->get_future();

    auto accepted = controller.cancel([promise] {
        promise->set_value(std::expected<void, TranscriptionError>{});
    });
    if (!accepted) {
        promise->set_value(std::unexpected(accepted.error()));
    }
    return future;
}

} // namespace async_session
