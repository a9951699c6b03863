/**
 * @file heating_decision.hpp
 * @brief Heating Decision
 *
 * Output of the heating decision engine, consumed by the seat heater actuator
 * and published as heating status.
 */

#ifndef HEATING_DECISION_HPP
#define HEATING_DECISION_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "heating_settings.hpp"
#include "vehicle_state.hpp"

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

/**
 * @brief Branch taken by the engine (diagnostic only)
 */
enum class DecisionReason {
    IGNITION_OFF,
    MODE_OFF,
    SENSOR_UNAVAILABLE,     // Temperature absent, fail-safe off
    ADAPTIVE_COLD,          // temp < 10°C
    ADAPTIVE_WARM,
    THRESHOLD_COLD,         // temp < threshold
    THRESHOLD_WARM,
    LATCH_HELD,             // Decided once at startup
    TIMER_EXPIRED           // Auto-off timer fired
};

struct HeatingDecision {
    bool is_active = false;
    int target_level = 0;                   /* 0..3, 0 when inactive */
    std::set<SeatZone> zones;               /* empty iff mode == OFF */
    bool turned_off_by_timer = false;
    std::optional<TimePoint> activated_at;

    DecisionReason reason = DecisionReason::IGNITION_OFF;
    std::string reason_text;

    // Inputs echoed for the actuator and for status reporting
    bool adaptive = false;
    HeatingMode mode = HeatingMode::OFF;
    IgnitionState ignition = IgnitionState::UNKNOWN;
    std::optional<float> current_temp;
    int threshold = DEFAULT_TEMPERATURE_THRESHOLD;
    bool latched = false;

    bool hasZone(SeatZone zone) const { return zones.count(zone) > 0; }

    /**
     * @brief Same hardware command (active, level, zones, adaptive)
     */
    bool sameCommandAs(const HeatingDecision& other) const {
        return is_active == other.is_active &&
               target_level == other.target_level &&
               zones == other.zones &&
               adaptive == other.adaptive;
    }
};

std::string toString(DecisionReason reason);

/**
 * @brief Status JSON for a decision
 */
nlohmann::json decisionToJson(const HeatingDecision& decision);

#endif // HEATING_DECISION_HPP
