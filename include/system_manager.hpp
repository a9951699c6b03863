/**
 * @file system_manager.hpp
 * @brief System Manager - Orchestrates all SHC components
 *
 * Builds the vehicle bus adapters, settings store, decision pipeline and
 * MQTT link from configuration, and owns their lifecycle.
 */

#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <atomic>
#include <mutex>
#include <vector>
#include "config_manager.hpp"
#include "settings_store.hpp"
#include "seat_actuator.hpp"
#include "actuation_worker.hpp"
#include "heating_controller.hpp"
#include "vehicle_signal_monitor.hpp"
#include "mqtt_client.hpp"
#include "doip_client.hpp"
#include "doip_vehicle_adapter.hpp"

/**
 * @brief System Manager Class
 *
 * Orchestrates initialization, command handling, and lifecycle management
 */
class SystemManager {
public:
    /**
     * @brief Constructor
     * @param config Configuration manager
     */
    explicit SystemManager(ConfigManager& config);
    ~SystemManager();

    /**
     * @brief Initialize all subsystems
     * @return true if successful
     */
    bool initialize();

    /**
     * @brief Check if system is running
     */
    bool isRunning() const { return running_; }

    /**
     * @brief Stop the system
     */
    void stop() { running_ = false; }

    /**
     * @brief Handle MQTT command
     */
    void handleMqttCommand(const std::string& topic, const std::string& payload);

    /**
     * @brief Graceful shutdown
     */
    void shutdown();

    /**
     * @brief Run in daemon mode (automatic operation)
     */
    void runDaemon();

private:
    ConfigManager& config_;
    std::atomic<bool> running_;
    bool shut_down_;

    // Vehicle bus
    std::shared_ptr<DoIPClient> doip_client_;  // Shared: seat heater and signal reads
    std::shared_ptr<DoIPSeatHeater> seat_heater_;
    std::shared_ptr<DoIPVehicleSignals> vehicle_signals_;

    // Heating pipeline
    std::unique_ptr<SettingsStore> settings_;
    std::unique_ptr<SeatHeaterActuator> actuator_;
    std::unique_ptr<ActuationWorker> worker_;
    std::unique_ptr<HeatingController> controller_;
    std::unique_ptr<VehicleSignalMonitor> monitor_;

    // Server link
    std::unique_ptr<MqttClient> mqtt_client_;
    std::string status_topic_;

    std::mutex results_mutex_;
    std::vector<ZoneActuationResult> last_results_;

    /**
     * @brief Setup MQTT message callback
     */
    void setupMqttCallback();

    /**
     * @brief Publish current decision, settings and last actuation results
     */
    void publishStatus(const HeatingDecision& decision);
};

#endif // SYSTEM_MANAGER_HPP
