/**
 * @file seat_actuator.cpp
 * @brief Seat Heater Actuator Implementation
 */

#include "seat_actuator.hpp"
#include <iostream>
#include "heating_settings.hpp"

std::string toString(ZonePhase phase) {
    switch (phase) {
        case ZonePhase::REQUESTED:
            return "REQUESTED";
        case ZonePhase::CONFIRMED:
            return "CONFIRMED";
        case ZonePhase::FAILED:
            return "FAILED";
        default:
            return "IDLE";
    }
}

std::string toString(ActuationStatus status) {
    switch (status) {
        case ActuationStatus::WRITTEN:
            return "written";
        case ActuationStatus::SKIPPED_MANUALLY_DISABLED:
            return "skipped_manually_disabled";
        case ActuationStatus::FAILED:
            return "failed";
        default:
            return "unavailable";
    }
}

SeatHeaterActuator::SeatHeaterActuator(std::shared_ptr<SeatHeaterInterface> hardware,
                                       const std::map<SeatZone, int>& zone_ids)
    : hardware_(hardware), zone_ids_(zone_ids) {
    for (const auto& entry : zone_ids_) {
        zones_[entry.first] = ZoneActuationState();
    }
}

std::vector<ZoneActuationResult> SeatHeaterActuator::apply(const HeatingDecision& decision) {
    std::vector<ZoneActuationResult> results;

    if (!hardware_ || !hardware_->isAvailable()) {
        std::cerr << "[ACTUATOR] ✗ Seat heater interface unavailable, nothing written\n";
        for (const auto& entry : zones_) {
            ZoneActuationResult result;
            result.zone = entry.first;
            result.status = ActuationStatus::UNAVAILABLE;
            result.error = "interface unavailable";
            results.push_back(result);
        }
        return results;
    }

    for (auto& entry : zones_) {
        const SeatZone zone = entry.first;
        ZoneActuationState& state = entry.second;
        const int zone_id = zone_ids_[zone];

        ZoneActuationResult result;
        result.zone = zone;

        // Override tracking is defined for fixed-level mode only
        if (!decision.adaptive && !state.resync_pending) {
            detectManualOverride(zone, state, result);
        }

        if (state.manually_disabled) {
            result.status = ActuationStatus::SKIPPED_MANUALLY_DISABLED;
            std::cout << "[ACTUATOR] " << toString(zone) << ": manually disabled, skipped\n";
            results.push_back(result);
            continue;
        }

        int desired = decision.hasZone(zone) ? decision.target_level : 0;
        if (!decision.adaptive && state.manual_level_override) {
            desired = *state.manual_level_override;
        }
        result.requested_level = desired;

        state.phase = ZonePhase::REQUESTED;
        if (hardware_->writeLevel(zone_id, desired)) {
            state.phase = ZonePhase::CONFIRMED;
            state.last_set_level = desired;
            state.resync_pending = false;
            result.status = ActuationStatus::WRITTEN;
            std::cout << "[ACTUATOR] ✓ " << toString(zone) << " (zone " << zone_id
                      << ") -> level " << desired << "\n";
        } else {
            state.phase = ZonePhase::FAILED;
            result.status = ActuationStatus::FAILED;
            result.error = "write failed";
            std::cerr << "[ACTUATOR] ✗ " << toString(zone) << " (zone " << zone_id
                      << ") write of level " << desired << " failed\n";
        }

        results.push_back(result);
    }

    return results;
}

void SeatHeaterActuator::detectManualOverride(SeatZone zone, ZoneActuationState& state,
                                              ZoneActuationResult& result) {
    std::optional<int> current = hardware_->readLevel(zone_ids_[zone]);
    result.observed_level = current;

    if (!current || *current == state.last_set_level) {
        return;
    }

    // Not a level the occupant can select; treat like a failed read
    if (*current < HEATING_LEVEL_MIN || *current > HEATING_LEVEL_MAX) {
        std::cerr << "[ACTUATOR] " << toString(zone) << ": ignoring read-back level "
                  << *current << "\n";
        return;
    }

    if (*current == 0 && state.last_set_level > 0) {
        state.manually_disabled = true;
        std::cout << "[ACTUATOR] " << toString(zone) << ": turned off by user\n";
    } else if (*current > 0) {
        state.manual_level_override = *current;
        std::cout << "[ACTUATOR] " << toString(zone) << ": user set level " << *current << "\n";
    }
}

void SeatHeaterActuator::resetOverrides() {
    for (auto& entry : zones_) {
        entry.second.manually_disabled = false;
        entry.second.manual_level_override.reset();
        // Hardware still shows the user's level; take it as the new baseline
        entry.second.resync_pending = true;
    }
    std::cout << "[ACTUATOR] Manual overrides cleared\n";
}

ZoneActuationState SeatHeaterActuator::getZoneState(SeatZone zone) const {
    auto it = zones_.find(zone);
    if (it == zones_.end()) {
        return ZoneActuationState();
    }
    return it->second;
}
