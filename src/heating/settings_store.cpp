/**
 * @file settings_store.cpp
 * @brief Heating Settings Store Implementation
 */

#include "settings_store.hpp"
#include <algorithm>
#include <iostream>

SettingsStore::SettingsStore()
    : revision_(0) {
}

SettingsStore::SettingsStore(const HeatingSettings& initial)
    : settings_(initial), revision_(0) {
    settings_.fixed_level = std::clamp(settings_.fixed_level, HEATING_LEVEL_MIN, HEATING_LEVEL_MAX);
    settings_.auto_off_minutes = std::clamp(settings_.auto_off_minutes, 0, AUTO_OFF_MINUTES_MAX);
}

SettingsSnapshot SettingsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SettingsSnapshot{settings_, revision_};
}

uint64_t SettingsStore::getRevision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

template <typename Fn>
void SettingsStore::mutate(Fn fn) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(settings_);
        revision_++;
        callback = change_callback_;
    }
    if (callback) {
        callback();
    }
}

// ========================================
// Mutators
// ========================================

void SettingsStore::setMode(HeatingMode mode) {
    mutate([mode](HeatingSettings& s) { s.mode = mode; });
}

void SettingsStore::setAdaptive(bool enabled) {
    mutate([enabled](HeatingSettings& s) { s.adaptive = enabled; });
}

void SettingsStore::setHeatingLevel(int level) {
    int clamped = std::clamp(level, HEATING_LEVEL_MIN, HEATING_LEVEL_MAX);
    mutate([clamped](HeatingSettings& s) { s.fixed_level = clamped; });
}

void SettingsStore::setCheckOnceOnStartup(bool enabled) {
    mutate([enabled](HeatingSettings& s) { s.check_once_on_startup = enabled; });
}

void SettingsStore::setAutoOffTimer(int minutes) {
    int clamped = std::clamp(minutes, 0, AUTO_OFF_MINUTES_MAX);
    mutate([clamped](HeatingSettings& s) { s.auto_off_minutes = clamped; });
}

void SettingsStore::setTemperatureSource(TemperatureSource source) {
    mutate([source](HeatingSettings& s) { s.temperature_source = source; });
}

void SettingsStore::setThreshold(int celsius) {
    mutate([celsius](HeatingSettings& s) { s.threshold = celsius; });
}

// ========================================
// JSON key space
// ========================================

bool SettingsStore::loadFromJson(const nlohmann::json& values) {
    if (!values.is_object()) {
        std::cerr << "[SETTINGS] ✗ Settings must be a JSON object\n";
        return false;
    }

    HeatingSettings parsed = snapshot().settings;

    try {
        if (values.contains("seatAutoHeatMode")) {
            if (!parseHeatingMode(values["seatAutoHeatMode"].get<std::string>(), parsed.mode)) {
                std::cerr << "[SETTINGS] ✗ Invalid seatAutoHeatMode: " << values["seatAutoHeatMode"] << "\n";
                return false;
            }
        }
        if (values.contains("temperatureSource")) {
            if (!parseTemperatureSource(values["temperatureSource"].get<std::string>(),
                                        parsed.temperature_source)) {
                std::cerr << "[SETTINGS] ✗ Invalid temperatureSource: " << values["temperatureSource"] << "\n";
                return false;
            }
        }
        parsed.adaptive = values.value("adaptiveHeating", parsed.adaptive);
        parsed.fixed_level = std::clamp(values.value("heatingLevel", parsed.fixed_level),
                                        HEATING_LEVEL_MIN, HEATING_LEVEL_MAX);
        parsed.check_once_on_startup = values.value("checkTempOnceOnStartup", parsed.check_once_on_startup);
        parsed.auto_off_minutes = std::clamp(values.value("autoOffTimerMinutes", parsed.auto_off_minutes),
                                             0, AUTO_OFF_MINUTES_MAX);
        parsed.threshold = values.value("temperatureThreshold", parsed.threshold);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[SETTINGS] ✗ Invalid settings value: " << e.what() << "\n";
        return false;
    }

    mutate([&parsed](HeatingSettings& s) { s = parsed; });
    std::cout << "[SETTINGS] ✓ Loaded: " << toJson().dump() << "\n";
    return true;
}

nlohmann::json SettingsStore::toJson() const {
    HeatingSettings s = snapshot().settings;
    return {
        {"seatAutoHeatMode", toString(s.mode)},
        {"adaptiveHeating", s.adaptive},
        {"heatingLevel", s.fixed_level},
        {"checkTempOnceOnStartup", s.check_once_on_startup},
        {"autoOffTimerMinutes", s.auto_off_minutes},
        {"temperatureSource", toString(s.temperature_source)},
        {"temperatureThreshold", s.threshold}
    };
}

void SettingsStore::setChangeCallback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = callback;
}
