/**
 * @file heating_engine.hpp
 * @brief Heating Decision Engine
 *
 * Pure state machine: (ignition, temperatures, settings, now) -> HeatingDecision.
 * No I/O and no clock access; the caller passes the monotonic time in.
 *
 * Policy:
 *   - Ignition not on (including UNKNOWN) -> off, latch and timer cleared
 *   - Mode OFF -> off
 *   - Adaptive: on below 10°C, level from table; otherwise on below threshold
 *   - Missing temperature -> off
 *   - Check-once: first decision with a temperature is held for the ignition cycle
 *   - Auto-off timer: heating forced off after N minutes until next ignition cycle
 *   - New settings revision -> latch and timer reset
 */

#ifndef HEATING_ENGINE_HPP
#define HEATING_ENGINE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include "heating_decision.hpp"
#include "settings_store.hpp"

class HeatingDecisionEngine {
public:
    HeatingDecisionEngine();

    /**
     * @brief Evaluate one event
     * @param ignition Latest ignition state
     * @param temperatures Latest temperature snapshot
     * @param snapshot Settings read atomically with their revision
     * @param now Monotonic time of the evaluation
     * @return Decision for this event
     */
    HeatingDecision evaluate(IgnitionState ignition,
                             const TemperatureSample& temperatures,
                             const SettingsSnapshot& snapshot,
                             TimePoint now);

    /**
     * @brief Forget latch and timer, next evaluation is a fresh startup
     */
    void resetDecisionState();

    const HeatingDecision& getLastDecision() const { return last_decision_; }
    bool isLatchArmed() const { return latch_armed_; }
    bool isTurnedOffByTimer() const { return turned_off_by_timer_; }
    std::optional<TimePoint> getActivatedAt() const { return activated_at_; }

    /**
     * @brief Adaptive level table: <=0 -> 3, <5 -> 2, <10 -> 1, else 0
     */
    static int adaptiveLevel(float temperature);

    static std::set<SeatZone> zonesForMode(HeatingMode mode);

private:
    bool latch_armed_;
    bool turned_off_by_timer_;
    std::optional<TimePoint> activated_at_;
    std::optional<uint64_t> last_revision_;
    HeatingDecision last_decision_;

    std::string describe(const HeatingDecision& decision,
                         const HeatingSettings& settings,
                         const std::optional<float>& temperature) const;
};

#endif // HEATING_ENGINE_HPP
