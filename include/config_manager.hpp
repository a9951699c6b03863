/**
 * @file config_manager.hpp
 * @brief Configuration Management Module
 *
 * Loads and manages SHC configuration from JSON file.
 * Getters fall back to built-in defaults for absent keys.
 */

#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Configuration Manager Class
 */
class ConfigManager {
public:
    /**
     * @brief Constructor
     * @param config_file Path to config.json
     */
    explicit ConfigManager(const std::string& config_file = "config.json");

    /**
     * @brief Load configuration from file
     * @return true if successful, false otherwise
     */
    bool load();

    /**
     * @brief Load configuration from an in-memory JSON document
     */
    bool loadFromString(const std::string& content);

    /**
     * @brief Check if configuration is loaded
     */
    bool isLoaded() const { return loaded_; }

    // ========================================
    // Server Configuration
    // ========================================

    std::string getServerHost() const;
    int getMqttPort() const;
    bool useMqttTls() const;

    // MQTT Settings
    int getMqttKeepAlive() const;
    int getMqttQos() const;

    // Topics
    std::string getCommandTopic(const std::string& device_id) const;
    std::string getStatusTopic(const std::string& device_id) const;

    // ========================================
    // Vehicle Configuration
    // ========================================

    std::string getVin() const;

    // ========================================
    // Device Configuration
    // ========================================

    std::string getDeviceId() const;
    std::string getDeviceName() const;
    std::string getSoftwareVersion() const;

    // ========================================
    // ZGW Configuration
    // ========================================

    std::string getZgwIp() const;
    int getZgwDoipPort() const;
    uint16_t getZgwLogicalAddress() const;
    uint16_t getIgnitionDid() const;
    uint16_t getCabinTempDid() const;
    uint16_t getAmbientTempDid() const;
    uint16_t getSeatHeaterDid() const;

    // ========================================
    // Seat Heater Configuration
    // ========================================

    int getDriverZoneId() const;
    int getPassengerZoneId() const;

    /**
     * @brief Initial heating settings (settings store key space)
     */
    nlohmann::json getHeatingSettings() const;

    // ========================================
    // TLS Configuration
    // ========================================

    bool verifyPeer() const;
    std::string getCaCert() const;

    // ========================================
    // Monitoring Configuration
    // ========================================

    int getPollIntervalMs() const;

    // ========================================
    // Logging Configuration
    // ========================================

    std::string getLogLevel() const;

    // ========================================
    // Raw JSON Access (for advanced use)
    // ========================================

    const nlohmann::json& getRawConfig() const { return config_; }

private:
    std::string config_file_;
    nlohmann::json config_;
    bool loaded_;

    template <typename T>
    T get(const char* pointer, const T& fallback) const;

    uint16_t getDid(const char* pointer, uint16_t fallback) const;

    std::string replacePlaceholder(const std::string& str, const std::string& placeholder, const std::string& value) const;
};

#endif // CONFIG_MANAGER_HPP
