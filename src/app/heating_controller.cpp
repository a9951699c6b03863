/**
 * @file heating_controller.cpp
 * @brief Heating Controller Implementation
 */

#include "heating_controller.hpp"
#include <iostream>

HeatingController::HeatingController(SettingsStore& settings, ActuationWorker& worker,
                                     ClockFunction clock)
    : settings_(settings),
      worker_(worker),
      clock_(clock),
      ignition_(IgnitionState::UNKNOWN),
      stopped_(false) {
    settings_.setChangeCallback([this]() { onSettingsChanged(); });
}

HeatingController::~HeatingController() {
    settings_.setChangeCallback(nullptr);
}

void HeatingController::onIgnition(IgnitionState state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ignition_ = state;
    }
    evaluate("ignition");
}

void HeatingController::onTemperature(const TemperatureSample& sample) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        temperatures_ = sample;
    }
    evaluate("temperature");
}

void HeatingController::onSettingsChanged() {
    evaluate("settings");
}

HeatingDecision HeatingController::getCurrentDecision() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void HeatingController::setStatusCallback(HeatingStatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_callback_ = callback;
}

void HeatingController::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    std::cout << "[HEAT] Controller stopped, seat heaters left at last level\n";
}

void HeatingController::evaluate(const char* trigger) {
    HeatingDecision decision;
    HeatingStatusCallback callback;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }

        const SettingsSnapshot snapshot = settings_.snapshot();
        const HeatingDecision previous = current_;

        decision = engine_.evaluate(ignition_, temperatures_, snapshot, clock_());

        bool ignition_went_off = isIgnitionOn(previous.ignition) && !isIgnitionOn(decision.ignition);
        bool timer_fired = !previous.turned_off_by_timer && decision.turned_off_by_timer;

        if (ignition_went_off || timer_fired) {
            std::cout << "[HEAT] " << (ignition_went_off ? "Ignition off" : "Auto-off timer")
                      << " - clearing manual overrides\n";
            worker_.requestOverrideReset();
        }

        // An unchanged command is resent while the previous write is incomplete
        if (!last_submitted_ || !decision.sameCommandAs(*last_submitted_) ||
            worker_.needsRetry()) {
            worker_.submit(decision);
            last_submitted_ = decision;
        }

        changed = !decision.sameCommandAs(previous) ||
                  decision.reason_text != previous.reason_text ||
                  decision.turned_off_by_timer != previous.turned_off_by_timer;

        current_ = decision;
        callback = status_callback_;
    }

    if (changed) {
        std::cout << "[HEAT] (" << trigger << ") "
                  << (decision.is_active ? "ON" : "OFF") << ": " << decision.reason_text << "\n";
        if (callback) {
            callback(decision);
        }
    }
}
