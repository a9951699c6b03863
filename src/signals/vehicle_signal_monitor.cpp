/**
 * @file vehicle_signal_monitor.cpp
 * @brief Vehicle Signal Monitor Implementation
 */

#include "vehicle_signal_monitor.hpp"
#include <chrono>
#include <iostream>

VehicleSignalMonitor::VehicleSignalMonitor(std::shared_ptr<VehicleSignalReader> reader,
                                           int poll_interval_ms)
    : reader_(reader),
      poll_interval_ms_(poll_interval_ms > 0 ? poll_interval_ms : 1000),
      running_(false),
      ignition_(IgnitionState::UNKNOWN) {
}

VehicleSignalMonitor::~VehicleSignalMonitor() {
    stop();
}

void VehicleSignalMonitor::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&VehicleSignalMonitor::run, this);
    std::cout << "[SIGNAL] ✓ Monitoring started (every " << poll_interval_ms_ << " ms)\n";
}

void VehicleSignalMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wait_cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    std::cout << "[SIGNAL] ✓ Monitoring stopped\n";
}

void VehicleSignalMonitor::pollOnce() {
    if (!reader_) {
        return;
    }

    // A failed ignition read keeps the last known state
    std::optional<int> raw = reader_->readIgnitionRaw();
    if (raw) {
        IgnitionState state = ignitionFromRaw(*raw);
        IgnitionState previous = ignition_.exchange(state);
        if (state != previous) {
            std::cout << "[SIGNAL] Ignition: " << toString(previous)
                      << " -> " << toString(state) << "\n";
            if (ignition_callback_) {
                ignition_callback_(state);
            }
        }
    }

    TemperatureSample sample;
    sample.cabin = reader_->readCabinTemperature();
    sample.ambient = reader_->readAmbientTemperature();

    if (temperature_callback_) {
        temperature_callback_(sample);
    }
}

void VehicleSignalMonitor::run() {
    while (running_) {
        pollOnce();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_), [this] {
            return !running_;
        });
    }
}
