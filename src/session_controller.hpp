#pragma once

#include "callback_bridge.hpp"
#include "delivery/delivery_context.hpp"
#include "engine/engine.hpp"
#include "segment.hpp"
#include "transcription_error.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Notification sink. Every method runs on the controller's delivery context.
class TranscriptionObserver {
public:
    virtual ~TranscriptionObserver() = default;
    virtual void on_progress(double /*fraction*/) {}
    virtual void on_new_segments(const std::vector<Segment>& /*segments*/, int /*start_index*/) {}
    virtual void on_completed(const std::vector<Segment>& /*segments*/) {}
    virtual void on_error(TranscriptionError /*error*/) {}
};

// Idle -> Running on accept, Running -> CancelRequested on cancel(),
// Running/CancelRequested -> Terminating when the engine call returns,
// Terminating -> Idle when the terminal notification runs.
enum class SessionState { Idle, Running, CancelRequested, Terminating };

class SessionController : public std::enable_shared_from_this<SessionController> {
public:
    using TranscribeResult = std::expected<std::vector<Segment>, TranscriptionError>;
    using CompletionHandler = std::function<void(TranscribeResult)>;
    using CancelHandler = std::function<void()>;

    static std::shared_ptr<SessionController> create(std::unique_ptr<Engine> engine,
                                                     std::shared_ptr<DeliveryContext> delivery,
                                                     DecodeParams params = {},
                                                     bool verbose = false);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Starts decoding samples on a background thread. Rejections are
    // returned here and on_complete is not called; once accepted,
    // on_complete runs exactly once on the delivery context.
    std::expected<void, TranscriptionError> transcribe(std::vector<float> samples,
                                                       CompletionHandler on_complete);

    // Asks the active session to stop at the engine's next continuation
    // check. on_cancelled runs on the delivery context, just before the
    // session reports Cancelled.
    std::expected<void, TranscriptionError> cancel(CancelHandler on_cancelled);

    bool in_progress() const;
    SessionState state() const;
    std::optional<size_t> frame_count() const;

    void set_observer(std::shared_ptr<TranscriptionObserver> observer);

    DecodeParams params() const;
    std::expected<void, TranscriptionError> set_params(DecodeParams params);

private:
    friend class CallbackBridge;

    SessionController(std::unique_ptr<Engine> engine, std::shared_ptr<DeliveryContext> delivery,
                      DecodeParams params, bool verbose);

    void run(CallbackBridge::Handle handle, std::vector<float> samples,
             CompletionHandler on_complete);

    // Terminating -> Idle; clears the per-request fields.
    void finish_session();

    bool should_continue() const;
    std::shared_ptr<TranscriptionObserver> observer() const;

    void log(const std::string& msg);

    std::unique_ptr<Engine> engine_;
    std::shared_ptr<DeliveryContext> delivery_;
    bool verbose_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::optional<size_t> frame_count_;
    CancelHandler pending_cancel_;
    DecodeParams params_;
    std::shared_ptr<TranscriptionObserver> observer_;

    std::jthread worker_;
};
