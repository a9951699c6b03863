/**
 * @file heating_controller.hpp
 * @brief Heating Controller
 *
 * Merges ignition and temperature streams (latest-value-combine),
 * runs the decision engine inline, and hands decisions to the actuation worker.
 * Registers itself as the settings store change callback, so every settings
 * mutation triggers a re-evaluation.
 *
 * Flow:
 *   VehicleSignalMonitor ─┐
 *   SettingsStore ────────┼─> HeatingController -> HeatingDecisionEngine
 *                         │                      -> ActuationWorker -> SeatHeaterActuator
 *                         └─> status callback (MQTT)
 */

#ifndef HEATING_CONTROLLER_HPP
#define HEATING_CONTROLLER_HPP

#include <functional>
#include <mutex>
#include <optional>
#include "actuation_worker.hpp"
#include "heating_engine.hpp"
#include "settings_store.hpp"
#include "vehicle_state.hpp"

using HeatingStatusCallback = std::function<void(const HeatingDecision&)>;
using ClockFunction = std::function<TimePoint()>;

class HeatingController {
public:
    /**
     * @brief Constructor
     * @param settings Settings store (snapshotted on every evaluation)
     * @param worker Actuation worker receiving decisions
     * @param clock Monotonic clock, replaceable in tests
     */
    HeatingController(SettingsStore& settings, ActuationWorker& worker,
                      ClockFunction clock = SteadyClock::now);
    ~HeatingController();

    // ========================================
    // Event inputs
    // ========================================

    void onIgnition(IgnitionState state);
    void onTemperature(const TemperatureSample& sample);
    void onSettingsChanged();

    // ========================================
    // Settings mutators (each starts a new decision epoch)
    // ========================================

    void setMode(HeatingMode mode) { settings_.setMode(mode); }
    void setThreshold(int celsius) { settings_.setThreshold(celsius); }
    void setAdaptive(bool enabled) { settings_.setAdaptive(enabled); }
    void setHeatingLevel(int level) { settings_.setHeatingLevel(level); }
    void setCheckOnceOnStartup(bool enabled) { settings_.setCheckOnceOnStartup(enabled); }
    void setAutoOffTimer(int minutes) { settings_.setAutoOffTimer(minutes); }
    void setTemperatureSource(TemperatureSource source) { settings_.setTemperatureSource(source); }

    /**
     * @brief Latest decision
     */
    HeatingDecision getCurrentDecision() const;

    void setStatusCallback(HeatingStatusCallback callback);

    /**
     * @brief Stop evaluating; hardware keeps its last level
     */
    void stop();

private:
    SettingsStore& settings_;
    ActuationWorker& worker_;
    ClockFunction clock_;

    mutable std::mutex mutex_;
    HeatingDecisionEngine engine_;
    IgnitionState ignition_;
    TemperatureSample temperatures_;
    HeatingDecision current_;
    std::optional<HeatingDecision> last_submitted_;
    HeatingStatusCallback status_callback_;
    bool stopped_;

    void evaluate(const char* trigger);
};

#endif // HEATING_CONTROLLER_HPP
