/**
 * @file seat_actuator.hpp
 * @brief Seat Heater Actuator
 *
 * Maps a HeatingDecision onto per-zone heater writes.
 *   - A failed write affects only its own zone
 *   - Hardware levels not set by this actuator are treated as manual overrides
 *     (fixed-level mode only) and honoured until resetOverrides()
 *   - Unavailable hardware turns apply() into a no-op
 */

#ifndef SEAT_ACTUATOR_HPP
#define SEAT_ACTUATOR_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "heating_decision.hpp"
#include "seat_heater_interface.hpp"

/**
 * @brief Per-zone request lifecycle
 */
enum class ZonePhase {
    IDLE,
    REQUESTED,
    CONFIRMED,
    FAILED
};

struct ZoneActuationState {
    int last_set_level = 0;
    bool manually_disabled = false;
    std::optional<int> manual_level_override;
    ZonePhase phase = ZonePhase::IDLE;
    bool resync_pending = false;            /* Skip detection until the next successful write */
};

enum class ActuationStatus {
    WRITTEN,
    SKIPPED_MANUALLY_DISABLED,
    FAILED,
    UNAVAILABLE
};

struct ZoneActuationResult {
    SeatZone zone = SeatZone::DRIVER;
    ActuationStatus status = ActuationStatus::UNAVAILABLE;
    int requested_level = 0;
    std::optional<int> observed_level;      /* Read-back before the write */
    std::string error;
};

std::string toString(ZonePhase phase);
std::string toString(ActuationStatus status);

class SeatHeaterActuator {
public:
    /**
     * @brief Constructor
     * @param hardware Seat heater interface
     * @param zone_ids Vendor zone id for each seat role
     */
    SeatHeaterActuator(std::shared_ptr<SeatHeaterInterface> hardware,
                       const std::map<SeatZone, int>& zone_ids);

    /**
     * @brief Apply a decision to every known zone
     * @return One result per zone
     */
    std::vector<ZoneActuationResult> apply(const HeatingDecision& decision);

    /**
     * @brief Forget manual overrides on all zones
     */
    void resetOverrides();

    ZoneActuationState getZoneState(SeatZone zone) const;

private:
    std::shared_ptr<SeatHeaterInterface> hardware_;
    std::map<SeatZone, int> zone_ids_;
    std::map<SeatZone, ZoneActuationState> zones_;

    void detectManualOverride(SeatZone zone, ZoneActuationState& state,
                              ZoneActuationResult& result);
};

#endif // SEAT_ACTUATOR_HPP
