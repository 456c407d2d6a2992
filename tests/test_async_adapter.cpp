#include <catch2/catch_test_macros.hpp>

#include "async_adapter.hpp"
#include "delivery/serial_delivery_context.hpp"
#include "mock_engine.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("async_session", "[async]") {
    auto delivery = std::make_shared<SerialDeliveryContext>();
    auto mock = std::make_unique<MockEngine>();
    mock->batches.push_back({NativeSegment{.t0 = 5, .t1 = 42, .text = " hi"}});
    MockEngine* engine = mock.get();
    auto controller = SessionController::create(std::move(mock), delivery);
    std::vector<float> samples(ENGINE_SAMPLE_RATE / 2, 0.0f);

    SECTION("ResolvesWithSegments") {
        auto fut = async_session::transcribe(*controller, samples);
        REQUIRE(fut.wait_for(5s) == std::future_status::ready);
        auto result = fut.get();
        REQUIRE(result.has_value());
        REQUIRE(result.value() == std::vector<Segment>{{50, 420, " hi"}});
    }

    SECTION("RejectionResolvesImmediately") {
        auto fut = async_session::transcribe(*controller, {});
        REQUIRE(fut.wait_for(0s) == std::future_status::ready);
        auto result = fut.get();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == TranscriptionError::InvalidInput);
    }

    SECTION("CancelWithoutSession") {
        auto fut = async_session::cancel(*controller);
        REQUIRE(fut.wait_for(0s) == std::future_status::ready);
        auto result = fut.get();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == TranscriptionError::NotInProgress);
    }

    SECTION("CancelResolvesBothWaits") {
        engine->hold = true;
        auto transcribed = async_session::transcribe(*controller, samples);
        REQUIRE(engine->wait_started());

        auto cancelled = async_session::cancel(*controller);
        auto second = async_session::cancel(*controller);
        REQUIRE(second.wait_for(0s) == std::future_status::ready);
        REQUIRE(second.get().error() == TranscriptionError::CancellationAlreadyPending);

        engine->release();

        REQUIRE(cancelled.wait_for(5s) == std::future_status::ready);
        REQUIRE(cancelled.get().has_value());

        REQUIRE(transcribed.wait_for(5s) == std::future_status::ready);
        auto result = transcribed.get();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == TranscriptionError::Cancelled);
    }

    delivery->stop();
}
