/**
 * @file heating_settings.hpp
 * @brief Seat Heating Settings
 *
 * User configuration consumed by the heating decision engine
 */

#ifndef HEATING_SETTINGS_HPP
#define HEATING_SETTINGS_HPP

#include <string>
#include "vehicle_state.hpp"

// ==================== Constants ====================

constexpr int HEATING_LEVEL_MIN = 0;
constexpr int HEATING_LEVEL_MAX = 3;
constexpr int AUTO_OFF_MINUTES_MAX = 20;        // 0 = timer disabled
constexpr int DEFAULT_TEMPERATURE_THRESHOLD = 15;
constexpr int DEFAULT_HEATING_LEVEL = 2;
constexpr float ADAPTIVE_THRESHOLD_CELSIUS = 10.0f;

// ==================== Type Definitions ====================

/**
 * @brief Which seats are heated automatically
 */
enum class HeatingMode {
    OFF,
    DRIVER,
    PASSENGER,
    BOTH
};

/**
 * @brief Heater-controlled seat roles
 */
enum class SeatZone {
    DRIVER,
    PASSENGER
};

/**
 * @brief Heating settings snapshot
 */
struct HeatingSettings {
    HeatingMode mode = HeatingMode::OFF;
    bool adaptive = false;
    int fixed_level = DEFAULT_HEATING_LEVEL;                /* 0..3 */
    bool check_once_on_startup = false;
    int auto_off_minutes = 0;                               /* 0..20, 0 = disabled */
    TemperatureSource temperature_source = TemperatureSource::CABIN;
    int threshold = DEFAULT_TEMPERATURE_THRESHOLD;          /* °C */
};

// ==================== Conversions ====================

std::string toString(HeatingMode mode);
std::string toString(SeatZone zone);
std::string toString(TemperatureSource source);

/**
 * @brief Parse settings key values ("off", "driver", ...)
 * @return true if the key is recognised
 */
bool parseHeatingMode(const std::string& key, HeatingMode& mode);
bool parseTemperatureSource(const std::string& key, TemperatureSource& source);

#endif // HEATING_SETTINGS_HPP
