#include <gtest/gtest.h>
#include <poll_controller.h>
#include "mocks/mock_adapters.h"

#include <memory>

using namespace VinFastCloud;

class PollControllerTest : public ::testing::Test {
protected:
    static constexpr const char *ENTITY = "sensor.charger_status_connector";

    void SetUp() override {
        scheduler = std::make_shared<MockScheduler>(14400);
        tracker = std::make_shared<MockStateTracker>();
    }

    std::unique_ptr<PollController> make_controller(PollConfig config = PollConfig()) {
        return std::make_unique<PollController>(scheduler, tracker, config);
    }

    std::shared_ptr<MockScheduler> scheduler;
    std::shared_ptr<MockStateTracker> tracker;
};

TEST_F(PollControllerTest, EvaluateTransitions) {
    PollConfig config;

    PollDecision start = PollController::evaluate(false, "Charging", config);
    EXPECT_TRUE(start.is_charging);
    EXPECT_TRUE(start.changed);
    EXPECT_TRUE(start.refresh_now);
    EXPECT_EQ(start.interval_seconds, 300u);

    PollDecision stop = PollController::evaluate(true, "Available", config);
    EXPECT_FALSE(stop.is_charging);
    EXPECT_TRUE(stop.changed);
    EXPECT_FALSE(stop.refresh_now);
    EXPECT_EQ(stop.interval_seconds, 14400u);

    PollDecision same = PollController::evaluate(true, "Charging", config);
    EXPECT_FALSE(same.changed);
    EXPECT_FALSE(same.refresh_now);

    // Compared verbatim
    EXPECT_FALSE(PollController::evaluate(false, "charging", config).is_charging);
}

TEST_F(PollControllerTest, IntervalFor) {
    PollConfig config;
    config.normal_interval_seconds = 600;
    config.charging_interval_seconds = 60;
    EXPECT_EQ(PollController::interval_for(true, config), 60u);
    EXPECT_EQ(PollController::interval_for(false, config), 600u);
}

TEST_F(PollControllerTest, SetupAppliesInitialStateWithoutRefresh) {
    tracker->set_state(ENTITY, "Charging");
    auto controller = make_controller();
    controller->setup();

    EXPECT_TRUE(controller->is_charging());
    EXPECT_EQ(controller->current_interval(), 300u);
    EXPECT_EQ(scheduler->get_interval_seconds(), 300u);
    EXPECT_EQ(scheduler->refresh_count(), 0);
    EXPECT_TRUE(controller->is_subscribed());
    EXPECT_EQ(tracker->subscription_count(), 1u);
}

TEST_F(PollControllerTest, ChargingStartSpeedsUpAndRefreshes) {
    auto controller = make_controller();
    controller->setup();
    EXPECT_EQ(scheduler->set_count(), 0);

    tracker->fire(ENTITY, "Charging");
    EXPECT_TRUE(controller->is_charging());
    EXPECT_EQ(scheduler->get_interval_seconds(), 300u);
    EXPECT_EQ(scheduler->refresh_count(), 1);

    tracker->fire(ENTITY, "Available");
    EXPECT_FALSE(controller->is_charging());
    EXPECT_EQ(scheduler->get_interval_seconds(), 14400u);
    EXPECT_EQ(scheduler->refresh_count(), 1);
    EXPECT_EQ(scheduler->set_count(), 2);
}

TEST_F(PollControllerTest, RepeatedStateIsIgnored) {
    auto controller = make_controller();
    controller->setup();

    tracker->fire(ENTITY, "Charging");
    tracker->fire(ENTITY, "Charging");
    tracker->fire(ENTITY, "Charging");

    EXPECT_EQ(scheduler->set_count(), 1);
    EXPECT_EQ(scheduler->refresh_count(), 1);

    // Any non-charging state counts as not charging
    tracker->fire(ENTITY, "Faulted");
    tracker->fire(ENTITY, "Unavailable");
    EXPECT_EQ(scheduler->set_count(), 2);
}

TEST_F(PollControllerTest, NullOldStateIsAccepted) {
    auto controller = make_controller();
    controller->on_state_changed(nullptr, "Charging");
    EXPECT_TRUE(controller->is_charging());
    EXPECT_EQ(scheduler->refresh_count(), 1);
}

TEST_F(PollControllerTest, OtherEntitiesAreIgnored) {
    auto controller = make_controller();
    controller->setup();

    tracker->fire("sensor.other", "Charging");
    EXPECT_FALSE(controller->is_charging());
    EXPECT_EQ(scheduler->refresh_count(), 0);
}

TEST_F(PollControllerTest, EmptyEntityDisablesListener) {
    PollConfig config;
    config.charger_entity = "";
    auto controller = make_controller(config);
    controller->setup();

    EXPECT_FALSE(controller->is_subscribed());
    EXPECT_EQ(tracker->subscription_count(), 0u);
    EXPECT_EQ(controller->current_interval(), 14400u);
}

TEST_F(PollControllerTest, MissingTrackerDisablesListener) {
    PollController controller(scheduler, nullptr);
    controller.setup();
    EXPECT_FALSE(controller.is_subscribed());
    controller.unsubscribe();
}

TEST_F(PollControllerTest, RefusedSubscription) {
    tracker->set_refuse_subscriptions(true);
    auto controller = make_controller();
    controller->setup();
    EXPECT_FALSE(controller->is_subscribed());
}

TEST_F(PollControllerTest, UnsubscribeIsIdempotent) {
    auto controller = make_controller();
    controller->unsubscribe();
    EXPECT_EQ(tracker->unsubscribe_count(), 0);

    controller->setup();
    controller->unsubscribe();
    controller->unsubscribe();
    EXPECT_EQ(tracker->unsubscribe_count(), 1);
    EXPECT_EQ(tracker->subscription_count(), 0u);

    tracker->fire(ENTITY, "Charging");
    EXPECT_FALSE(controller->is_charging());
}

TEST_F(PollControllerTest, DestructorUnsubscribes) {
    {
        auto controller = make_controller();
        controller->setup();
        EXPECT_EQ(tracker->subscription_count(), 1u);
    }
    EXPECT_EQ(tracker->subscription_count(), 0u);
    EXPECT_EQ(tracker->unsubscribe_count(), 1);
}

TEST_F(PollControllerTest, SetupTwiceKeepsOneSubscription) {
    auto controller = make_controller();
    controller->setup();
    controller->setup();
    EXPECT_EQ(tracker->subscription_count(), 1u);
}
