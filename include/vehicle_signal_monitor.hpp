/**
 * @file vehicle_signal_monitor.hpp
 * @brief Vehicle Signal Monitor
 *
 * Polls ignition and temperatures from the vehicle and feeds the heating controller.
 *   - Ignition: forwarded only when it changes (push semantics)
 *   - Temperatures: forwarded on every tick (~1s)
 */

#ifndef VEHICLE_SIGNAL_MONITOR_HPP
#define VEHICLE_SIGNAL_MONITOR_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include "vehicle_state.hpp"

/**
 * @brief Source of raw vehicle signals
 */
class VehicleSignalReader {
public:
    virtual ~VehicleSignalReader() = default;

    /**
     * @brief Raw ignition value (VehicleIgnitionState encoding), empty on read failure
     */
    virtual std::optional<int> readIgnitionRaw() = 0;

    /**
     * @brief Temperatures in °C, empty while the sensor is not ready
     */
    virtual std::optional<float> readCabinTemperature() = 0;
    virtual std::optional<float> readAmbientTemperature() = 0;
};

using IgnitionCallback = std::function<void(IgnitionState)>;
using TemperatureCallback = std::function<void(const TemperatureSample&)>;

class VehicleSignalMonitor {
public:
    /**
     * @brief Constructor
     * @param reader Signal reader
     * @param poll_interval_ms Poll period
     */
    VehicleSignalMonitor(std::shared_ptr<VehicleSignalReader> reader, int poll_interval_ms = 1000);
    ~VehicleSignalMonitor();

    void setIgnitionCallback(IgnitionCallback callback) { ignition_callback_ = callback; }
    void setTemperatureCallback(TemperatureCallback callback) { temperature_callback_ = callback; }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    /**
     * @brief Run a single poll cycle on the calling thread
     */
    void pollOnce();

    IgnitionState getIgnitionState() const { return ignition_; }

private:
    std::shared_ptr<VehicleSignalReader> reader_;
    int poll_interval_ms_;
    std::atomic<bool> running_;
    std::atomic<IgnitionState> ignition_;
    IgnitionCallback ignition_callback_;
    TemperatureCallback temperature_callback_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;

    void run();
};

#endif // VEHICLE_SIGNAL_MONITOR_HPP
