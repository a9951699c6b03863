/**
 * @file heating_decision.cpp
 * @brief Heating Decision Helpers
 */

#include "heating_decision.hpp"

std::string toString(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::IGNITION_OFF:
            return "ignition_off";
        case DecisionReason::MODE_OFF:
            return "mode_off";
        case DecisionReason::SENSOR_UNAVAILABLE:
            return "sensor_unavailable";
        case DecisionReason::ADAPTIVE_COLD:
            return "adaptive_cold";
        case DecisionReason::ADAPTIVE_WARM:
            return "adaptive_warm";
        case DecisionReason::THRESHOLD_COLD:
            return "threshold_cold";
        case DecisionReason::THRESHOLD_WARM:
            return "threshold_warm";
        case DecisionReason::LATCH_HELD:
            return "latch_held";
        case DecisionReason::TIMER_EXPIRED:
            return "timer_expired";
    }
    return "unknown";
}

nlohmann::json decisionToJson(const HeatingDecision& decision) {
    nlohmann::json zones = nlohmann::json::array();
    for (SeatZone zone : decision.zones) {
        zones.push_back(toString(zone));
    }

    nlohmann::json status = {
        {"is_active", decision.is_active},
        {"target_level", decision.target_level},
        {"zones", zones},
        {"turned_off_by_timer", decision.turned_off_by_timer},
        {"mode", toString(decision.mode)},
        {"adaptive", decision.adaptive},
        {"ignition", toString(decision.ignition)},
        {"threshold", decision.threshold},
        {"latched", decision.latched},
        {"reason", toString(decision.reason)},
        {"reason_text", decision.reason_text}
    };

    if (decision.current_temp) {
        status["current_temp"] = *decision.current_temp;
    } else {
        status["current_temp"] = nullptr;
    }

    return status;
}
