/**
 * @file test_heating_controller.cpp
 * @brief Heating controller tests (stream combination, reset wiring)
 */

#include <gtest/gtest.h>
#include <memory>
#include "fake_seat_heater.hpp"
#include "heating_controller.hpp"

using namespace std::chrono_literals;

namespace {

constexpr int DRIVER_ZONE_ID = 1;
constexpr int PASSENGER_ZONE_ID = 4;

HeatingSettings driverSettings() {
    HeatingSettings settings;
    settings.mode = HeatingMode::DRIVER;
    settings.fixed_level = 2;
    settings.threshold = 15;
    return settings;
}

TemperatureSample cabin(float celsius) {
    TemperatureSample sample;
    sample.cabin = celsius;
    return sample;
}

class HeatingControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSeatHeater> hardware = std::make_shared<FakeSeatHeater>();
    SettingsStore store{driverSettings()};
    SeatHeaterActuator actuator{hardware, {{SeatZone::DRIVER, DRIVER_ZONE_ID},
                                           {SeatZone::PASSENGER, PASSENGER_ZONE_ID}}};
    ActuationWorker worker{actuator};
    TimePoint now = TimePoint() + std::chrono::hours(1);
    HeatingController controller{store, worker, [this]() { return now; }};

    void SetUp() override { worker.start(); }
    void TearDown() override { worker.stop(); }

    void settle() { ASSERT_TRUE(worker.waitUntilIdle(2000ms)); }
};

}  // namespace

TEST_F(HeatingControllerTest, CombinesLatestIgnitionAndTemperature) {
    controller.onTemperature(cabin(5.0f));
    EXPECT_FALSE(controller.getCurrentDecision().is_active);

    // Ignition event is evaluated against the last temperature seen
    controller.onIgnition(IgnitionState::RUN);
    HeatingDecision decision = controller.getCurrentDecision();
    EXPECT_TRUE(decision.is_active);
    EXPECT_EQ(decision.target_level, 2);

    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 0);

    controller.onTemperature(cabin(20.0f));
    EXPECT_FALSE(controller.getCurrentDecision().is_active);
    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
}

TEST_F(HeatingControllerTest, SettingsMutationReevaluatesImmediately) {
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(10.0f));
    ASSERT_TRUE(controller.getCurrentDecision().is_active);

    controller.setThreshold(5);
    EXPECT_FALSE(controller.getCurrentDecision().is_active);

    controller.setMode(HeatingMode::BOTH);
    controller.setThreshold(15);
    controller.setHeatingLevel(3);
    HeatingDecision decision = controller.getCurrentDecision();
    EXPECT_TRUE(decision.is_active);
    EXPECT_EQ(decision.target_level, 3);

    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 3);
}

TEST_F(HeatingControllerTest, IgnitionOffClearsManualOverrides) {
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(5.0f));
    settle();
    ASSERT_EQ(hardware->level(DRIVER_ZONE_ID), 2);

    // Occupant switches the seat off; next command leaves it alone
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 0);
    controller.setHeatingLevel(3);
    settle();
    EXPECT_TRUE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);

    controller.onIgnition(IgnitionState::OFF);
    settle();
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);

    controller.onIgnition(IgnitionState::RUN);
    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);
}

TEST_F(HeatingControllerTest, AutoOffTimerUsesInjectedClock) {
    controller.setAutoOffTimer(5);
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(5.0f));
    ASSERT_TRUE(controller.getCurrentDecision().is_active);
    settle();

    now += 4min;
    controller.onTemperature(cabin(5.0f));
    EXPECT_TRUE(controller.getCurrentDecision().is_active);

    now += 1min;
    controller.onTemperature(cabin(5.0f));
    HeatingDecision decision = controller.getCurrentDecision();
    EXPECT_FALSE(decision.is_active);
    EXPECT_TRUE(decision.turned_off_by_timer);

    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
}

TEST_F(HeatingControllerTest, StatusReportedOnlyOnChange) {
    std::vector<HeatingDecision> reports;
    controller.setStatusCallback([&reports](const HeatingDecision& decision) {
        reports.push_back(decision);
    });

    controller.onIgnition(IgnitionState::RUN);
    size_t baseline = reports.size();

    controller.onTemperature(cabin(5.0f));
    ASSERT_EQ(reports.size(), baseline + 1);
    EXPECT_TRUE(reports.back().is_active);

    controller.onTemperature(cabin(5.0f));
    controller.onTemperature(cabin(5.0f));
    EXPECT_EQ(reports.size(), baseline + 1);

    controller.onTemperature(cabin(25.0f));
    ASSERT_EQ(reports.size(), baseline + 2);
    EXPECT_FALSE(reports.back().is_active);
}

TEST_F(HeatingControllerTest, StopIgnoresFurtherEvents) {
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(5.0f));
    settle();

    controller.stop();
    controller.onTemperature(cabin(30.0f));
    EXPECT_TRUE(controller.getCurrentDecision().is_active);

    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
}

TEST_F(HeatingControllerTest, FailedWriteRetriedOnNextEvent) {
    hardware->setWriteFailure(DRIVER_ZONE_ID, true);
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(5.0f));
    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
    EXPECT_TRUE(worker.needsRetry());

    // Same command, but the previous write did not land
    hardware->setWriteFailure(DRIVER_ZONE_ID, false);
    controller.onTemperature(cabin(5.0f));
    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
    EXPECT_FALSE(worker.needsRetry());

    // Nothing outstanding: an unchanged command is not resent
    uint64_t applied = worker.getAppliedCount();
    controller.onTemperature(cabin(5.0f));
    settle();
    EXPECT_EQ(worker.getAppliedCount(), applied);
}

TEST_F(HeatingControllerTest, UnavailableHardwareRecoversOnLaterEvent) {
    hardware->setAvailable(false);
    controller.onIgnition(IgnitionState::RUN);
    controller.onTemperature(cabin(5.0f));
    settle();
    EXPECT_TRUE(hardware->writes().empty());
    EXPECT_TRUE(worker.needsRetry());

    hardware->setAvailable(true);
    controller.onTemperature(cabin(5.0f));
    settle();
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 0);
    EXPECT_FALSE(worker.needsRetry());
}
