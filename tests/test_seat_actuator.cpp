/**
 * @file test_seat_actuator.cpp
 * @brief Seat heater actuator tests
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "fake_seat_heater.hpp"
#include "seat_actuator.hpp"

namespace {

constexpr int DRIVER_ZONE_ID = 1;
constexpr int PASSENGER_ZONE_ID = 4;

HeatingDecision makeDecision(bool active, int level, std::set<SeatZone> zones, bool adaptive = false) {
    HeatingDecision decision;
    decision.is_active = active;
    decision.target_level = active ? level : 0;
    decision.zones = zones;
    decision.adaptive = adaptive;
    return decision;
}

const ZoneActuationResult& resultFor(const std::vector<ZoneActuationResult>& results, SeatZone zone) {
    for (const auto& result : results) {
        if (result.zone == zone) {
            return result;
        }
    }
    throw std::runtime_error("zone missing from results");
}

class SeatActuatorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSeatHeater> hardware = std::make_shared<FakeSeatHeater>();
    SeatHeaterActuator actuator{hardware, {{SeatZone::DRIVER, DRIVER_ZONE_ID},
                                           {SeatZone::PASSENGER, PASSENGER_ZONE_ID}}};
    const std::set<SeatZone> both{SeatZone::DRIVER, SeatZone::PASSENGER};
};

}  // namespace

TEST_F(SeatActuatorTest, WritesTargetLevelToSelectedZones) {
    auto results = actuator.apply(makeDecision(true, 2, both));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::WRITTEN);
    EXPECT_EQ(resultFor(results, SeatZone::PASSENGER).status, ActuationStatus::WRITTEN);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 2);
    EXPECT_EQ(actuator.getZoneState(SeatZone::DRIVER).last_set_level, 2);
    EXPECT_EQ(actuator.getZoneState(SeatZone::DRIVER).phase, ZonePhase::CONFIRMED);
}

TEST_F(SeatActuatorTest, UnselectedZoneIsCommandedToZero) {
    hardware->setHardwareLevel(PASSENGER_ZONE_ID, 0);

    auto results = actuator.apply(makeDecision(true, 3, {SeatZone::DRIVER}, true));

    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 0);
    EXPECT_EQ(resultFor(results, SeatZone::PASSENGER).requested_level, 0);
    EXPECT_EQ(resultFor(results, SeatZone::PASSENGER).status, ActuationStatus::WRITTEN);
}

TEST_F(SeatActuatorTest, InactiveDecisionTurnsEveryZoneOff) {
    actuator.apply(makeDecision(true, 2, both));
    auto results = actuator.apply(makeDecision(false, 0, both));

    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 0);
    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).requested_level, 0);
}

TEST_F(SeatActuatorTest, WriteFailureIsIsolatedToOneZone) {
    hardware->setWriteFailure(DRIVER_ZONE_ID, true);

    auto results = actuator.apply(makeDecision(true, 2, both));

    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::FAILED);
    EXPECT_EQ(resultFor(results, SeatZone::PASSENGER).status, ActuationStatus::WRITTEN);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 2);
    EXPECT_EQ(actuator.getZoneState(SeatZone::DRIVER).phase, ZonePhase::FAILED);
    EXPECT_EQ(actuator.getZoneState(SeatZone::DRIVER).last_set_level, 0);

    // Failed zone is retried on the next decision
    hardware->setWriteFailure(DRIVER_ZONE_ID, false);
    results = actuator.apply(makeDecision(true, 2, both));
    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::WRITTEN);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
}

TEST_F(SeatActuatorTest, UnavailableInterfaceWritesNothing) {
    hardware->setAvailable(false);

    auto results = actuator.apply(makeDecision(true, 2, both));

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_EQ(result.status, ActuationStatus::UNAVAILABLE);
    }
    EXPECT_TRUE(hardware->writes().empty());

    hardware->setAvailable(true);
    results = actuator.apply(makeDecision(true, 2, both));
    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::WRITTEN);
}

TEST_F(SeatActuatorTest, UserTurningSeatOffDisablesZone) {
    actuator.apply(makeDecision(true, 2, both));
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 0);
    hardware->clearWrites();

    auto results = actuator.apply(makeDecision(true, 3, both));

    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::SKIPPED_MANUALLY_DISABLED);
    EXPECT_TRUE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 3);

    for (const auto& write : hardware->writes()) {
        EXPECT_NE(write.first, DRIVER_ZONE_ID);
    }
}

TEST_F(SeatActuatorTest, UserLevelOverridesDecisionLevel) {
    actuator.apply(makeDecision(true, 2, both));
    hardware->setHardwareLevel(PASSENGER_ZONE_ID, 1);

    auto results = actuator.apply(makeDecision(true, 3, both));

    const auto& passenger = resultFor(results, SeatZone::PASSENGER);
    ASSERT_TRUE(passenger.observed_level.has_value());
    EXPECT_EQ(*passenger.observed_level, 1);
    EXPECT_EQ(passenger.requested_level, 1);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 1);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);

    // Override sticks while the decision changes
    actuator.apply(makeDecision(true, 2, both));
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 1);
}

TEST_F(SeatActuatorTest, ResetOverridesRestoresControl) {
    actuator.apply(makeDecision(true, 2, both));
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 0);
    hardware->setHardwareLevel(PASSENGER_ZONE_ID, 3);
    actuator.apply(makeDecision(true, 2, both));

    EXPECT_TRUE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_TRUE(actuator.getZoneState(SeatZone::PASSENGER).manual_level_override.has_value());

    actuator.resetOverrides();
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_FALSE(actuator.getZoneState(SeatZone::PASSENGER).manual_level_override.has_value());

    // Hardware still shows the user's levels; the engine takes control again
    actuator.apply(makeDecision(false, 0, both));
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 0);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 0);
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);

    actuator.apply(makeDecision(true, 1, both));
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 1);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 1);
}

TEST_F(SeatActuatorTest, AdaptiveModeDoesNotTrackOverrides) {
    actuator.apply(makeDecision(true, 2, both, true));
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 0);
    hardware->setHardwareLevel(PASSENGER_ZONE_ID, 1);

    auto results = actuator.apply(makeDecision(true, 3, both, true));

    EXPECT_EQ(resultFor(results, SeatZone::DRIVER).status, ActuationStatus::WRITTEN);
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_FALSE(actuator.getZoneState(SeatZone::PASSENGER).manual_level_override.has_value());
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);
    EXPECT_EQ(hardware->level(PASSENGER_ZONE_ID), 3);
}

TEST_F(SeatActuatorTest, FailedReadBackSkipsOverrideDetection) {
    actuator.apply(makeDecision(true, 2, both));
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 0);
    hardware->setReadFailure(DRIVER_ZONE_ID, true);

    auto results = actuator.apply(makeDecision(true, 2, both));

    EXPECT_FALSE(resultFor(results, SeatZone::DRIVER).observed_level.has_value());
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);
}

TEST_F(SeatActuatorTest, OutOfRangeReadBackIsNotAnOverride) {
    actuator.apply(makeDecision(true, 2, both));
    hardware->setHardwareLevel(DRIVER_ZONE_ID, 200);

    auto results = actuator.apply(makeDecision(true, 2, both));

    const ZoneActuationResult& driver = resultFor(results, SeatZone::DRIVER);
    EXPECT_EQ(driver.status, ActuationStatus::WRITTEN);
    EXPECT_EQ(driver.requested_level, 2);
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manual_level_override.has_value());
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 2);

    hardware->setHardwareLevel(DRIVER_ZONE_ID, -1);
    actuator.apply(makeDecision(true, 3, both));
    EXPECT_FALSE(actuator.getZoneState(SeatZone::DRIVER).manually_disabled);
    EXPECT_EQ(hardware->level(DRIVER_ZONE_ID), 3);
}
