/**
 * @file heating_engine.cpp
 * @brief Heating Decision Engine Implementation
 */

#include "heating_engine.hpp"
#include <algorithm>
#include <sstream>

HeatingDecisionEngine::HeatingDecisionEngine()
    : latch_armed_(false),
      turned_off_by_timer_(false) {
}

void HeatingDecisionEngine::resetDecisionState() {
    latch_armed_ = false;
    turned_off_by_timer_ = false;
    activated_at_.reset();
    // Next activation starts a new timer epoch
    last_decision_.is_active = false;
}

int HeatingDecisionEngine::adaptiveLevel(float temperature) {
    if (temperature <= 0.0f) {
        return 3;
    }
    if (temperature < 5.0f) {
        return 2;
    }
    if (temperature < ADAPTIVE_THRESHOLD_CELSIUS) {
        return 1;
    }
    return 0;
}

std::set<SeatZone> HeatingDecisionEngine::zonesForMode(HeatingMode mode) {
    switch (mode) {
        case HeatingMode::DRIVER:
            return {SeatZone::DRIVER};
        case HeatingMode::PASSENGER:
            return {SeatZone::PASSENGER};
        case HeatingMode::BOTH:
            return {SeatZone::DRIVER, SeatZone::PASSENGER};
        default:
            return {};
    }
}

HeatingDecision HeatingDecisionEngine::evaluate(IgnitionState ignition,
                                                const TemperatureSample& temperatures,
                                                const SettingsSnapshot& snapshot,
                                                TimePoint now) {
    const HeatingSettings& settings = snapshot.settings;

    if (last_revision_ && *last_revision_ != snapshot.revision) {
        resetDecisionState();
    }
    last_revision_ = snapshot.revision;

    const bool was_active = last_decision_.is_active;
    const std::optional<float> temperature = temperatures.get(settings.temperature_source);

    HeatingDecision decision;
    decision.adaptive = settings.adaptive;
    decision.mode = settings.mode;
    decision.ignition = ignition;
    decision.threshold = settings.threshold;
    decision.current_temp = temperature ? temperature : temperatures.cabin;
    decision.zones = zonesForMode(settings.mode);

    bool raw = false;
    bool held_by_latch = false;

    if (!isIgnitionOn(ignition)) {
        latch_armed_ = false;
        turned_off_by_timer_ = false;
        activated_at_.reset();
        decision.reason = DecisionReason::IGNITION_OFF;
    } else if (settings.mode == HeatingMode::OFF) {
        decision.reason = DecisionReason::MODE_OFF;
    } else {
        if (settings.check_once_on_startup && latch_armed_) {
            raw = was_active;
            held_by_latch = true;
            decision.reason = DecisionReason::LATCH_HELD;
        } else {
            if (!temperature) {
                raw = false;
                decision.reason = DecisionReason::SENSOR_UNAVAILABLE;
            } else if (settings.adaptive) {
                raw = *temperature < ADAPTIVE_THRESHOLD_CELSIUS;
                decision.reason = raw ? DecisionReason::ADAPTIVE_COLD : DecisionReason::ADAPTIVE_WARM;
            } else {
                raw = *temperature < static_cast<float>(settings.threshold);
                decision.reason = raw ? DecisionReason::THRESHOLD_COLD : DecisionReason::THRESHOLD_WARM;
            }

            if (settings.check_once_on_startup && temperature && !latch_armed_) {
                latch_armed_ = true;
            }
        }

        if (settings.auto_off_minutes > 0 && activated_at_ &&
            now - *activated_at_ >= std::chrono::minutes(settings.auto_off_minutes)) {
            turned_off_by_timer_ = true;
        }

        if (turned_off_by_timer_) {
            decision.reason = DecisionReason::TIMER_EXPIRED;
        }
    }

    decision.is_active = raw && !turned_off_by_timer_;

    // Activation edges drive the auto-off timer
    if (decision.is_active && !was_active) {
        if (settings.auto_off_minutes > 0) {
            activated_at_ = now;
        } else {
            activated_at_.reset();
        }
    } else if (!decision.is_active && was_active) {
        activated_at_.reset();
    }

    if (decision.is_active) {
        if (held_by_latch) {
            decision.target_level = last_decision_.target_level;
        } else if (settings.adaptive) {
            decision.target_level = adaptiveLevel(*temperature);
        } else {
            decision.target_level = std::clamp(settings.fixed_level, HEATING_LEVEL_MIN, HEATING_LEVEL_MAX);
        }
    } else {
        decision.target_level = 0;
    }

    decision.turned_off_by_timer = turned_off_by_timer_;
    decision.activated_at = activated_at_;
    decision.latched = latch_armed_;
    decision.reason_text = describe(decision, settings, temperature);

    last_decision_ = decision;
    return decision;
}

std::string HeatingDecisionEngine::describe(const HeatingDecision& decision,
                                            const HeatingSettings& settings,
                                            const std::optional<float>& temperature) const {
    std::ostringstream text;
    const std::string source = toString(settings.temperature_source);
    const char* outcome = decision.is_active ? "on" : "off";

    switch (decision.reason) {
        case DecisionReason::IGNITION_OFF:
            text << "Ignition off";
            break;
        case DecisionReason::MODE_OFF:
            text << "Mode: off";
            break;
        case DecisionReason::TIMER_EXPIRED:
            text << "[Timer] Auto-off after " << settings.auto_off_minutes << " min";
            break;
        case DecisionReason::LATCH_HELD:
            text << "[Latch] Temperature (" << source << ") ";
            if (temperature) {
                text << static_cast<int>(*temperature) << "°C";
            } else {
                text << "unavailable";
            }
            text << ", startup decision held -> " << outcome;
            break;
        case DecisionReason::SENSOR_UNAVAILABLE:
            text << (settings.adaptive ? "[Adaptive]" : "[Threshold]")
                 << " Temperature (" << source << ") unavailable -> off";
            break;
        case DecisionReason::ADAPTIVE_COLD:
        case DecisionReason::ADAPTIVE_WARM:
            text << "[Adaptive] Temperature (" << source << ") "
                 << static_cast<int>(*temperature) << "°C "
                 << (decision.reason == DecisionReason::ADAPTIVE_COLD ? "<" : ">=")
                 << " 10°C -> " << outcome;
            break;
        case DecisionReason::THRESHOLD_COLD:
        case DecisionReason::THRESHOLD_WARM:
            text << "[Threshold] Temperature (" << source << ") "
                 << static_cast<int>(*temperature) << "°C "
                 << (decision.reason == DecisionReason::THRESHOLD_COLD ? "<" : ">=")
                 << " " << settings.threshold << "°C -> " << outcome;
            break;
    }

    if (decision.is_active) {
        text << " (level " << decision.target_level << ")";
    }
    if (decision.latched && decision.reason != DecisionReason::LATCH_HELD) {
        text << " [latched]";
    }

    return text.str();
}
