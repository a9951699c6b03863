/**
 * @file system_manager.cpp
 * @brief System Manager Implementation
 */

#include "system_manager.hpp"
#include <iostream>
#include <chrono>
#include <thread>

SystemManager::SystemManager(ConfigManager& config)
    : config_(config),
      running_(false),
      shut_down_(false) {
}

SystemManager::~SystemManager() {
    shutdown();
}

bool SystemManager::initialize() {
    std::cout << "\n[INIT] Initializing SHC System...\n";
    std::cout << "[INIT] Device: " << config_.getDeviceName() << " (" << config_.getDeviceId()
              << ", SW " << config_.getSoftwareVersion() << ")\n";

    // 1. Initialize DoIP Client (shared by seat heater and signal reader)
    std::cout << "[INIT] Setting up DoIP client...\n";
    doip_client_ = std::make_shared<DoIPClient>(
        config_.getZgwIp(),
        config_.getZgwDoipPort(),
        config_.getZgwLogicalAddress()
    );
    doip_client_->setTraceEnabled(config_.getLogLevel() == "debug");

    if (doip_client_->connect()) {
        std::cout << "[INIT] ✓ DoIP connected to ZGW\n";
    } else {
        // Adapters reconnect lazily on the next read/write
        std::cerr << "[INIT] ✗ ZGW not reachable yet, will retry\n";
    }

    seat_heater_ = std::make_shared<DoIPSeatHeater>(doip_client_, config_.getSeatHeaterDid());
    vehicle_signals_ = std::make_shared<DoIPVehicleSignals>(
        doip_client_,
        config_.getIgnitionDid(),
        config_.getCabinTempDid(),
        config_.getAmbientTempDid()
    );

    // 2. Settings store seeded from configuration
    settings_ = std::make_unique<SettingsStore>();
    if (!settings_->loadFromJson(config_.getHeatingSettings())) {
        std::cerr << "[INIT] ✗ Invalid heating settings in config\n";
        return false;
    }

    // 3. Actuation layer
    std::map<SeatZone, int> zone_ids = {
        {SeatZone::DRIVER, config_.getDriverZoneId()},
        {SeatZone::PASSENGER, config_.getPassengerZoneId()}
    };
    actuator_ = std::make_unique<SeatHeaterActuator>(seat_heater_, zone_ids);
    worker_ = std::make_unique<ActuationWorker>(*actuator_);
    worker_->setResultCallback([this](const HeatingDecision& decision,
                                      const std::vector<ZoneActuationResult>& results) {
        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            last_results_ = results;
        }
        publishStatus(decision);
    });
    std::cout << "[INIT] ✓ Actuation layer initialized (driver zone " << zone_ids[SeatZone::DRIVER]
              << ", passenger zone " << zone_ids[SeatZone::PASSENGER] << ")\n";

    // 4. Heating controller
    controller_ = std::make_unique<HeatingController>(*settings_, *worker_);

    // 5. Vehicle signal monitor feeding the controller
    monitor_ = std::make_unique<VehicleSignalMonitor>(vehicle_signals_, config_.getPollIntervalMs());
    monitor_->setIgnitionCallback([this](IgnitionState state) {
        controller_->onIgnition(state);
    });
    monitor_->setTemperatureCallback([this](const TemperatureSample& sample) {
        controller_->onTemperature(sample);
    });

    // 6. MQTT link (optional: heating keeps working without it)
    std::cout << "[INIT] Setting up MQTT client...\n";
    std::string client_id = config_.getDeviceId() + "_mqtt";
    status_topic_ = config_.getStatusTopic(config_.getDeviceId());

    mqtt_client_ = std::make_unique<MqttClient>(
        config_.getServerHost(),
        config_.getMqttPort(),
        client_id,
        config_.getVin(),
        config_.useMqttTls(),
        config_.verifyPeer(),
        config_.getCaCert()
    );
    setupMqttCallback();

    if (mqtt_client_->connect(config_.getMqttKeepAlive())) {
        std::string command_topic = config_.getCommandTopic(config_.getDeviceId());
        if (!mqtt_client_->subscribe(command_topic, config_.getMqttQos())) {
            std::cerr << "[INIT] ✗ Failed to subscribe to command topic\n";
        }
    } else {
        std::cerr << "[INIT] ✗ MQTT unavailable, running without remote settings\n";
    }

    controller_->setStatusCallback([this](const HeatingDecision& decision) {
        publishStatus(decision);
    });

    std::cout << "[INIT] ✓ All subsystems initialized\n";

    running_ = true;
    return true;
}

void SystemManager::setupMqttCallback() {
    mqtt_client_->setMessageCallback([this](const std::string& topic, const std::string& payload) {
        handleMqttCommand(topic, payload);
    });
}

void SystemManager::handleMqttCommand(const std::string& topic, const std::string& payload) {
    try {
        nlohmann::json cmd = nlohmann::json::parse(payload);
        std::string command = cmd.at("command").get<std::string>();

        std::cout << "\n[MQTT] Command received on " << topic << ": " << command << "\n";

        if (command == "set_mode") {
            HeatingMode mode;
            if (!parseHeatingMode(cmd.at("mode").get<std::string>(), mode)) {
                std::cerr << "[MQTT] Invalid mode: " << cmd["mode"] << "\n";
                return;
            }
            controller_->setMode(mode);

        } else if (command == "set_threshold") {
            controller_->setThreshold(cmd.at("value").get<int>());

        } else if (command == "set_adaptive") {
            controller_->setAdaptive(cmd.at("enabled").get<bool>());

        } else if (command == "set_heating_level") {
            controller_->setHeatingLevel(cmd.at("level").get<int>());

        } else if (command == "set_check_once") {
            controller_->setCheckOnceOnStartup(cmd.at("enabled").get<bool>());

        } else if (command == "set_auto_off_timer") {
            controller_->setAutoOffTimer(cmd.at("minutes").get<int>());

        } else if (command == "set_temperature_source") {
            TemperatureSource source;
            if (!parseTemperatureSource(cmd.at("source").get<std::string>(), source)) {
                std::cerr << "[MQTT] Invalid temperature source: " << cmd["source"] << "\n";
                return;
            }
            controller_->setTemperatureSource(source);

        } else if (command == "get_status") {
            publishStatus(controller_->getCurrentDecision());

        } else if (command == "shutdown") {
            std::cout << "       Initiating graceful shutdown...\n";
            stop();

        } else {
            std::cout << "       Unknown command\n";
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[MQTT] Error parsing command: " << e.what() << std::endl;
    }
}

void SystemManager::publishStatus(const HeatingDecision& decision) {
    if (!mqtt_client_ || !mqtt_client_->isConnected()) {
        return;
    }

    nlohmann::json status = decisionToJson(decision);
    status["settings"] = settings_->toJson();

    nlohmann::json zones = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        for (const auto& result : last_results_) {
            nlohmann::json zone = {
                {"zone", toString(result.zone)},
                {"status", toString(result.status)},
                {"requested_level", result.requested_level}
            };
            if (result.observed_level) {
                zone["observed_level"] = *result.observed_level;
            }
            if (!result.error.empty()) {
                zone["error"] = result.error;
            }
            zones.push_back(zone);
        }
    }
    status["actuation"] = zones;

    if (!mqtt_client_->sendHeatingStatus(status_topic_, status, config_.getMqttQos())) {
        std::cerr << "[MQTT] ✗ Failed to publish heating status\n";
    }
}

void SystemManager::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    running_ = false;

    std::cout << "\n[SHUTDOWN] Cleaning up SHC System...\n";

    if (monitor_) {
        monitor_->stop();
    }
    if (controller_) {
        controller_->stop();
    }
    if (worker_) {
        worker_->stop();
    }

    if (mqtt_client_) {
        mqtt_client_->disconnect();
        std::cout << "[SHUTDOWN] ✓ MQTT disconnected\n";
    }
    if (doip_client_) {
        doip_client_->disconnect();
        std::cout << "[SHUTDOWN] ✓ DoIP disconnected\n";
    }

    std::cout << "[SHUTDOWN] ✓ SHC gracefully shut down\n";
}

void SystemManager::runDaemon() {
    std::cout << "\n[DAEMON] Mode enabled - Automatic operation\n";

    worker_->start();
    monitor_->start();

    std::cout << "[MAIN] Entering main loop (Press Ctrl+C to exit)...\n\n";

    while (running_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}
