#include <catch2/catch_test_macros.hpp>

#include "callback_bridge.hpp"
#include "mock_engine.hpp"
#include "session_controller.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

class CountingObserver : public TranscriptionObserver {
public:
    int progress_calls = 0;
    std::vector<Segment> last_segments;
    int last_start_index = -1;

    void on_progress(double) override { ++progress_calls; }
    void on_new_segments(const std::vector<Segment>& segments, int start_index) override {
        last_segments = segments;
        last_start_index = start_index;
    }
};

} // namespace

TEST_CASE("CallbackBridge registry", "[bridge]") {
    auto delivery = std::make_shared<QueueDeliveryContext>();
    auto controller = SessionController::create(std::make_unique<MockEngine>(), delivery);

    SECTION("UnknownHandleIsHarmless") {
        void* user_data = CallbackBridge::to_user_data(987654321);
        REQUIRE(CallbackBridge::continue_check(user_data));
        CallbackBridge::new_segments(3, user_data);
        REQUIRE(delivery->pending() == 0);
    }

    SECTION("RegisterLookupUnregister") {
        auto a = CallbackBridge::register_controller(controller);
        auto b = CallbackBridge::register_controller(controller);
        REQUIRE(a != 0);
        REQUIRE(b != 0);
        REQUIRE(a != b);
        REQUIRE(CallbackBridge::registered_count() == 2);
        REQUIRE(CallbackBridge::lookup(a) == controller);

        CallbackBridge::unregister(a);
        REQUIRE(CallbackBridge::lookup(a) == nullptr);
        REQUIRE(CallbackBridge::lookup(b) == controller);

        CallbackBridge::unregister(b);
        CallbackBridge::unregister(b);
        REQUIRE(CallbackBridge::registered_count() == 0);
    }

    SECTION("RegistryHoldsStrongReference") {
        std::weak_ptr<SessionController> weak = controller;
        auto handle = CallbackBridge::register_controller(controller);
        controller.reset();
        REQUIRE_FALSE(weak.expired());

        CallbackBridge::unregister(handle);
        REQUIRE(weak.expired());
    }

    SECTION("UserDataCarriesHandle") {
        CallbackBridge::Handle h = 42;
        REQUIRE(CallbackBridge::from_user_data(CallbackBridge::to_user_data(h)) == 42);
    }

    SECTION("InstallFillsBothSlots") {
        DecodeParams params;
        params.language = "nl";
        CallbackBridge::install(params, 7);
        REQUIRE((params.continue_callback == &CallbackBridge::continue_check));
        REQUIRE((params.new_segment_callback == &CallbackBridge::new_segments));
        REQUIRE(CallbackBridge::from_user_data(params.continue_user_data) == 7);
        REQUIRE(CallbackBridge::from_user_data(params.new_segment_user_data) == 7);
        REQUIRE(params.language == "nl");
    }

    SECTION("IdleControllerAllowsContinuation") {
        auto handle = CallbackBridge::register_controller(controller);
        REQUIRE(CallbackBridge::continue_check(CallbackBridge::to_user_data(handle)));
        REQUIRE(CallbackBridge::continue_check(CallbackBridge::to_user_data(handle)));
        CallbackBridge::unregister(handle);
    }
}

TEST_CASE("CallbackBridge new segments", "[bridge]") {
    auto delivery = std::make_shared<QueueDeliveryContext>();
    auto mock = std::make_unique<MockEngine>();
    mock->preset({
        {.t0 = 0, .t1 = 5, .text = "a"},
        {.t0 = 5, .t1 = 42, .text = "b"},
        {.t0 = 42, .t1 = 80, .text = "c"},
    });
    auto controller = SessionController::create(std::move(mock), delivery);
    auto handle = CallbackBridge::register_controller(controller);
    void* user_data = CallbackBridge::to_user_data(handle);

    SECTION("NoObserverPostsNothing") {
        CallbackBridge::new_segments(2, user_data);
        REQUIRE(delivery->pending() == 0);
    }

    SECTION("ConvertsOnlyTheNewRange") {
        auto observer = std::make_shared<CountingObserver>();
        controller->set_observer(observer);

        CallbackBridge::new_segments(2, user_data);
        REQUIRE(delivery->run_until([&] { return observer->last_start_index >= 0; }));

        REQUIRE(observer->last_start_index == 1);
        REQUIRE(observer->last_segments == std::vector<Segment>{
            {50, 420, "b"}, {420, 800, "c"}});
        // No active request, so no sample count to measure progress against
        REQUIRE(observer->progress_calls == 0);
    }

    SECTION("ZeroNewSegments") {
        auto observer = std::make_shared<CountingObserver>();
        controller->set_observer(observer);

        CallbackBridge::new_segments(0, user_data);
        REQUIRE(delivery->pending() == 1);
        REQUIRE(delivery->run_until([&] { return observer->last_start_index >= 0; }));
        REQUIRE(observer->last_start_index == 3);
        REQUIRE(observer->last_segments.empty());
    }

    CallbackBridge::unregister(handle);
}
