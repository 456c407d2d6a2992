#include "session_controller.hpp"

#include <chrono>
#include <format>
#include <print>

std::shared_ptr<SessionController> SessionController::create(std::unique_ptr<Engine> engine,
                                                             std::shared_ptr<DeliveryContext> delivery,
                                                             DecodeParams params, bool verbose) {
    return std::shared_ptr<SessionController>(
        new SessionController(std::move(engine), std::move(delivery), std::move(params), verbose));
}

SessionController::SessionController(std::unique_ptr<Engine> engine,
                                     std::shared_ptr<DeliveryContext> delivery,
                                     DecodeParams params, bool verbose)
    : engine_(std::move(engine)), delivery_(std::move(delivery)), verbose_(verbose),
      params_(std::move(params)) {}

SessionController::~SessionController() {
    if (worker_.joinable()) {
        // The worker may hold the last reference to us.
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

std::expected<void, TranscriptionError>
SessionController::transcribe(std::vector<float> samples, CompletionHandler on_complete) {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Idle) {
        return std::unexpected(TranscriptionError::InstanceBusy);
    }
    if (samples.empty()) {
        return std::unexpected(TranscriptionError::InvalidInput);
    }

    state_ = SessionState::Running;
    frame_count_ = samples.size();

    auto self = shared_from_this();
    auto handle = CallbackBridge::register_controller(self);

    log(std::format("Transcribing {} samples ({:.1f}s)", samples.size(),
                    static_cast<double>(samples.size()) / ENGINE_SAMPLE_RATE));

    worker_ = std::jthread([self = std::move(self), handle, samples = std::move(samples),
                            on_complete = std::move(on_complete)]() mutable {
        self->run(handle, std::move(samples), std::move(on_complete));
    });
    return {};
}

std::expected<void, TranscriptionError> SessionController::cancel(CancelHandler on_cancelled) {
    std::lock_guard lock(mutex_);
    switch (state_) {
        case SessionState::Idle:
            return std::unexpected(TranscriptionError::NotInProgress);
        case SessionState::CancelRequested:
            return std::unexpected(TranscriptionError::CancellationAlreadyPending);
        case SessionState::Terminating:
            // The engine has already returned; nothing left to stop.
            if (pending_cancel_) return std::unexpected(TranscriptionError::CancellationAlreadyPending);
            return std::unexpected(TranscriptionError::NotInProgress);
        case SessionState::Running:
            break;
    }

    pending_cancel_ = on_cancelled ? std::move(on_cancelled) : CancelHandler([] {});
    state_ = SessionState::CancelRequested;
    log("Cancellation requested");
    return {};
}

bool SessionController::in_progress() const {
    std::lock_guard lock(mutex_);
    return state_ != SessionState::Idle;
}

SessionState SessionController::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<size_t> SessionController::frame_count() const {
    std::lock_guard lock(mutex_);
    return frame_count_;
}

void SessionController::set_observer(std::shared_ptr<TranscriptionObserver> observer) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(observer);
}

DecodeParams SessionController::params() const {
    std::lock_guard lock(mutex_);
    return params_;
}

std::expected<void, TranscriptionError> SessionController::set_params(DecodeParams params) {
    std::lock_guard lock(mutex_);
    if (state_ != SessionState::Idle) {
        return std::unexpected(TranscriptionError::InstanceBusy);
    }
    params_ = std::move(params);
    return {};
}

void SessionController::run(CallbackBridge::Handle handle, std::vector<float> samples,
                            CompletionHandler on_complete) {
    // Callback slots live only in this per-request copy.
    DecodeParams params = this->params();
    CallbackBridge::install(params, handle);

    auto start = std::chrono::steady_clock::now();
    int rc = engine_->run_full(samples, params);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    auto segments = read_segments(*engine_, 0, engine_->segment_count());
    CallbackBridge::unregister(handle);

    CancelHandler on_cancelled;
    {
        std::lock_guard lock(mutex_);
        on_cancelled = pending_cancel_;
        state_ = SessionState::Terminating;
    }

    if (rc != 0 && !on_cancelled) {
        std::println(stderr, "[whisper-session] engine returned status {}, {} segments decoded",
                     rc, segments.size());
    }

    auto self = shared_from_this();
    auto obs = observer();

    if (on_cancelled) {
        log(std::format("Transcription cancelled after {:.2f}s", elapsed));
        delivery_->post([self, obs, on_cancelled = std::move(on_cancelled),
                         on_complete = std::move(on_complete)] {
            self->finish_session();
            on_cancelled();
            if (obs) obs->on_error(TranscriptionError::Cancelled);
            if (on_complete) on_complete(std::unexpected(TranscriptionError::Cancelled));
        });
    } else {
        log(std::format("Transcription complete: {:.2f}s processing, {} segments",
                        elapsed, segments.size()));
        delivery_->post([self, obs, segments = std::move(segments),
                         on_complete = std::move(on_complete)] {
            self->finish_session();
            if (obs) obs->on_completed(segments);
            if (on_complete) on_complete(segments);
        });
    }
}

void SessionController::finish_session() {
    std::lock_guard lock(mutex_);
    frame_count_.reset();
    pending_cancel_ = nullptr;
    state_ = SessionState::Idle;
}

bool SessionController::should_continue() const {
    std::lock_guard lock(mutex_);
    return state_ != SessionState::CancelRequested;
}

std::shared_ptr<TranscriptionObserver> SessionController::observer() const {
    std::lock_guard lock(mutex_);
    return observer_;
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-session] {}", msg);
    }
}
