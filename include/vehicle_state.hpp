/**
 * @file vehicle_state.hpp
 * @brief Vehicle State Types
 *
 * Ignition state and temperature snapshot as delivered by the vehicle bus
 */

#ifndef VEHICLE_STATE_HPP
#define VEHICLE_STATE_HPP

#include <string>
#include <optional>

/**
 * @brief Vehicle ignition states
 */
enum class IgnitionState {
    OFF,        // LOCK / OFF
    ACCESSORY,  // ACC
    START,      // Cranking
    RUN,        // Engine on
    UNKNOWN     // Not yet read or undefined
};

/**
 * @brief Raw ignition values on the bus (VehicleIgnitionState encoding)
 */
constexpr int IGNITION_RAW_UNDEFINED = 0;
constexpr int IGNITION_RAW_LOCK = 1;
constexpr int IGNITION_RAW_OFF = 2;
constexpr int IGNITION_RAW_ACC = 3;
constexpr int IGNITION_RAW_ON = 4;
constexpr int IGNITION_RAW_START = 5;

/**
 * @brief Engine is running (RUN or START)
 */
bool isIgnitionOn(IgnitionState state);

/**
 * @brief Ignition is off. UNKNOWN counts as off.
 */
bool isIgnitionOff(IgnitionState state);

/**
 * @brief Map raw bus value to IgnitionState
 * @param raw Raw VehicleIgnitionState value
 * @return Decoded state, UNKNOWN for unrecognised values
 */
IgnitionState ignitionFromRaw(int raw);

std::string toString(IgnitionState state);

/**
 * @brief Temperature sources
 */
enum class TemperatureSource {
    CABIN,
    AMBIENT
};

/**
 * @brief Temperature snapshot
 *
 * Either value may be absent while the sensor is not ready.
 */
struct TemperatureSample {
    std::optional<float> cabin;
    std::optional<float> ambient;

    std::optional<float> get(TemperatureSource source) const {
        return source == TemperatureSource::AMBIENT ? ambient : cabin;
    }
};

#endif // VEHICLE_STATE_HPP
