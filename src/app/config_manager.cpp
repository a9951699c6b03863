/**
 * @file config_manager.cpp
 * @brief Configuration Management Module Implementation
 */

#include "config_manager.hpp"
#include <fstream>
#include <iostream>

using json = nlohmann::json;

ConfigManager::ConfigManager(const std::string& config_file)
    : config_file_(config_file), loaded_(false) {
}

bool ConfigManager::load() {
    std::ifstream file(config_file_);
    if (!file.is_open()) {
        std::cerr << "[CONFIG] Failed to open: " << config_file_ << std::endl;
        return false;
    }

    try {
        file >> config_;
        loaded_ = true;
        std::cout << "[CONFIG] ✓ Loaded from " << config_file_ << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] Parse error: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& content) {
    try {
        config_ = json::parse(content);
        loaded_ = true;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Parse error: " << e.what() << std::endl;
        return false;
    }
}

template <typename T>
T ConfigManager::get(const char* pointer, const T& fallback) const {
    try {
        return config_.value(json::json_pointer(pointer), fallback);
    } catch (const json::exception& e) {
        std::cerr << "[CONFIG] Invalid value at " << pointer << ": " << e.what()
                  << " (using default)" << std::endl;
        return fallback;
    }
}

// DIDs may be written as numbers or as hex strings ("0xF190")
uint16_t ConfigManager::getDid(const char* pointer, uint16_t fallback) const {
    json::json_pointer ptr(pointer);
    if (!config_.contains(ptr)) {
        return fallback;
    }

    const json& value = config_.at(ptr);
    long long did = -1;
    try {
        if (value.is_number_integer()) {
            did = value.get<long long>();
        } else if (value.is_string()) {
            const std::string text = value.get<std::string>();
            size_t used = 0;
            did = std::stoll(text, &used, 0);
            if (used != text.size()) {
                did = -1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] Invalid DID at " << pointer << ": " << e.what() << std::endl;
        return fallback;
    }

    if (did >= 0 && did <= 0xFFFF) {
        return static_cast<uint16_t>(did);
    }
    std::cerr << "[CONFIG] Invalid DID at " << pointer << ": " << value.dump() << std::endl;
    return fallback;
}

// ========================================
// Server Configuration
// ========================================

std::string ConfigManager::getServerHost() const {
    return get<std::string>("/server/host", "localhost");
}

int ConfigManager::getMqttPort() const {
    return get("/server/mqtt/port", 1883);
}

bool ConfigManager::useMqttTls() const {
    return get("/server/mqtt/use_tls", false);
}

int ConfigManager::getMqttKeepAlive() const {
    return get("/server/mqtt/keep_alive_sec", 60);
}

int ConfigManager::getMqttQos() const {
    return get("/server/mqtt/qos", 1);
}

// Topics
std::string ConfigManager::getCommandTopic(const std::string& device_id) const {
    std::string topic = get<std::string>("/server/mqtt/topics/command", "shc/{device_id}/command");
    return replacePlaceholder(topic, "{device_id}", device_id);
}

std::string ConfigManager::getStatusTopic(const std::string& device_id) const {
    std::string topic = get<std::string>("/server/mqtt/topics/status", "shc/{device_id}/status");
    return replacePlaceholder(topic, "{device_id}", device_id);
}

// ========================================
// Vehicle Configuration
// ========================================

std::string ConfigManager::getVin() const {
    return get<std::string>("/vehicle/vin", "");
}

// ========================================
// Device Configuration
// ========================================

std::string ConfigManager::getDeviceId() const {
    return get<std::string>("/device/id", "shc-001");
}

std::string ConfigManager::getDeviceName() const {
    return get<std::string>("/device/name", "Seat Heat Controller");
}

std::string ConfigManager::getSoftwareVersion() const {
    return get<std::string>("/device/software_version", "1.0.0");
}

// ========================================
// ZGW Configuration
// ========================================

std::string ConfigManager::getZgwIp() const {
    return get<std::string>("/zgw/ip_address", "192.168.1.10");
}

int ConfigManager::getZgwDoipPort() const {
    return get("/zgw/doip_port", 13400);
}

uint16_t ConfigManager::getZgwLogicalAddress() const {
    return getDid("/zgw/logical_address", 0x0100);
}

uint16_t ConfigManager::getIgnitionDid() const {
    return getDid("/zgw/uds/ignition_did", 0xF410);
}

uint16_t ConfigManager::getCabinTempDid() const {
    return getDid("/zgw/uds/cabin_temp_did", 0xF420);
}

uint16_t ConfigManager::getAmbientTempDid() const {
    return getDid("/zgw/uds/ambient_temp_did", 0xF421);
}

uint16_t ConfigManager::getSeatHeaterDid() const {
    return getDid("/zgw/uds/seat_heater_did", 0xF500);
}

// ========================================
// Seat Heater Configuration
// ========================================

int ConfigManager::getDriverZoneId() const {
    return get("/seat_heater/driver_zone_id", 1);
}

int ConfigManager::getPassengerZoneId() const {
    return get("/seat_heater/passenger_zone_id", 4);
}

json ConfigManager::getHeatingSettings() const {
    if (config_.is_object() && config_.contains("heating")) {
        return config_["heating"];
    }
    return json::object();
}

// ========================================
// TLS Configuration
// ========================================

bool ConfigManager::verifyPeer() const {
    return get("/tls/verify_peer", true);
}

std::string ConfigManager::getCaCert() const {
    return get<std::string>("/tls/ca_cert", "certs/ca.crt");
}

// ========================================
// Monitoring Configuration
// ========================================

int ConfigManager::getPollIntervalMs() const {
    int interval = get("/monitoring/poll_interval_ms", 1000);
    return interval > 0 ? interval : 1000;
}

// ========================================
// Logging Configuration
// ========================================

std::string ConfigManager::getLogLevel() const {
    return get<std::string>("/logging/level", "info");
}

// ========================================
// Helper Functions
// ========================================

std::string ConfigManager::replacePlaceholder(const std::string& str, const std::string& placeholder, const std::string& value) const {
    std::string result = str;
    size_t pos = result.find(placeholder);
    if (pos != std::string::npos) {
        result.replace(pos, placeholder.length(), value);
    }
    return result;
}
