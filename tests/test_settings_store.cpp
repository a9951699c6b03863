/**
 * @file test_settings_store.cpp
 * @brief Settings store tests
 */

#include <gtest/gtest.h>
#include "settings_store.hpp"

TEST(SettingsStoreTest, DefaultsMatchProductDefaults) {
    SettingsStore store;
    HeatingSettings settings = store.snapshot().settings;

    EXPECT_EQ(settings.mode, HeatingMode::OFF);
    EXPECT_FALSE(settings.adaptive);
    EXPECT_EQ(settings.fixed_level, DEFAULT_HEATING_LEVEL);
    EXPECT_FALSE(settings.check_once_on_startup);
    EXPECT_EQ(settings.auto_off_minutes, 0);
    EXPECT_EQ(settings.temperature_source, TemperatureSource::CABIN);
    EXPECT_EQ(settings.threshold, 15);
    EXPECT_EQ(store.getRevision(), 0u);
}

TEST(SettingsStoreTest, EveryMutationBumpsRevisionAndNotifies) {
    SettingsStore store;
    int notifications = 0;
    store.setChangeCallback([&notifications]() { notifications++; });

    store.setMode(HeatingMode::BOTH);
    store.setAdaptive(true);
    store.setHeatingLevel(1);
    store.setCheckOnceOnStartup(true);
    store.setAutoOffTimer(10);
    store.setTemperatureSource(TemperatureSource::AMBIENT);
    store.setThreshold(8);

    EXPECT_EQ(store.getRevision(), 7u);
    EXPECT_EQ(notifications, 7);

    SettingsSnapshot snapshot = store.snapshot();
    EXPECT_EQ(snapshot.revision, 7u);
    EXPECT_EQ(snapshot.settings.mode, HeatingMode::BOTH);
    EXPECT_TRUE(snapshot.settings.adaptive);
    EXPECT_EQ(snapshot.settings.fixed_level, 1);
    EXPECT_TRUE(snapshot.settings.check_once_on_startup);
    EXPECT_EQ(snapshot.settings.auto_off_minutes, 10);
    EXPECT_EQ(snapshot.settings.temperature_source, TemperatureSource::AMBIENT);
    EXPECT_EQ(snapshot.settings.threshold, 8);
}

TEST(SettingsStoreTest, ClampsOutOfRangeValues) {
    SettingsStore store;

    store.setHeatingLevel(7);
    EXPECT_EQ(store.snapshot().settings.fixed_level, 3);
    store.setHeatingLevel(-1);
    EXPECT_EQ(store.snapshot().settings.fixed_level, 0);

    store.setAutoOffTimer(45);
    EXPECT_EQ(store.snapshot().settings.auto_off_minutes, 20);
    store.setAutoOffTimer(-3);
    EXPECT_EQ(store.snapshot().settings.auto_off_minutes, 0);
}

TEST(SettingsStoreTest, CallbackMayReadStore) {
    SettingsStore store;
    int seen_threshold = 0;
    store.setChangeCallback([&store, &seen_threshold]() {
        seen_threshold = store.snapshot().settings.threshold;
    });

    store.setThreshold(3);
    EXPECT_EQ(seen_threshold, 3);
}

TEST(SettingsStoreTest, LoadsKeySpaceFromJson) {
    SettingsStore store;
    nlohmann::json values = {
        {"seatAutoHeatMode", "passenger"},
        {"adaptiveHeating", true},
        {"heatingLevel", 5},
        {"checkTempOnceOnStartup", true},
        {"autoOffTimerMinutes", 12},
        {"temperatureSource", "ambient"},
        {"temperatureThreshold", 9}
    };

    ASSERT_TRUE(store.loadFromJson(values));
    HeatingSettings settings = store.snapshot().settings;
    EXPECT_EQ(settings.mode, HeatingMode::PASSENGER);
    EXPECT_TRUE(settings.adaptive);
    EXPECT_EQ(settings.fixed_level, 3);
    EXPECT_TRUE(settings.check_once_on_startup);
    EXPECT_EQ(settings.auto_off_minutes, 12);
    EXPECT_EQ(settings.temperature_source, TemperatureSource::AMBIENT);
    EXPECT_EQ(settings.threshold, 9);

    nlohmann::json exported = store.toJson();
    EXPECT_EQ(exported["seatAutoHeatMode"], "passenger");
    EXPECT_EQ(exported["heatingLevel"], 3);
    EXPECT_EQ(exported["temperatureSource"], "ambient");
}

TEST(SettingsStoreTest, PartialJsonKeepsOtherValues) {
    SettingsStore store;
    store.setThreshold(4);

    ASSERT_TRUE(store.loadFromJson({{"seatAutoHeatMode", "driver"}}));
    EXPECT_EQ(store.snapshot().settings.mode, HeatingMode::DRIVER);
    EXPECT_EQ(store.snapshot().settings.threshold, 4);
}

TEST(SettingsStoreTest, RejectsInvalidJsonWithoutApplying) {
    SettingsStore store;
    uint64_t revision = store.getRevision();

    EXPECT_FALSE(store.loadFromJson({{"seatAutoHeatMode", "rear"}}));
    EXPECT_FALSE(store.loadFromJson({{"temperatureSource", "seat"}}));
    EXPECT_FALSE(store.loadFromJson({{"seatAutoHeatMode", "both"}, {"heatingLevel", "high"}}));
    EXPECT_FALSE(store.loadFromJson(nlohmann::json::array()));

    EXPECT_EQ(store.getRevision(), revision);
    EXPECT_EQ(store.snapshot().settings.mode, HeatingMode::OFF);
}
