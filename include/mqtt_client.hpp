/**
 * @file mqtt_client.hpp
 * @brief MQTT Client for SHC (Paho MQTT C++)
 *
 * Link to the head unit / companion app:
 * - Command topic: settings changes and status requests
 * - Status topic: heating status reports
 */

#ifndef MQTT_CLIENT_HPP
#define MQTT_CLIENT_HPP

#include <string>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>
#include <mqtt/async_client.h>
#include <nlohmann/json.hpp>

using MqttMessageCallback = std::function<void(const std::string&, const std::string&)>;

/**
 * @brief MQTT Client wrapper for Paho MQTT C++
 */
class MqttClient {
public:
    /**
     * @brief Constructor
     * @param host MQTT broker host
     * @param port MQTT broker port
     * @param client_id MQTT client ID
     * @param vin Vehicle VIN (reported in every status message)
     * @param use_tls Enable TLS
     * @param verify_peer Verify SSL peer
     * @param ca_cert CA certificate path (TLS only)
     */
    MqttClient(const std::string& host, int port, const std::string& client_id,
               const std::string& vin = "",
               bool use_tls = false, bool verify_peer = true,
               const std::string& ca_cert = "ca.crt");
    ~MqttClient();

    /**
     * @brief Connect to MQTT broker
     * @param keep_alive_sec Keep-alive interval
     */
    bool connect(int keep_alive_sec = 60);

    /**
     * @brief Disconnect from broker
     */
    void disconnect();

    /**
     * @brief Check if connected
     */
    bool isConnected() const;

    /**
     * @brief Subscribe to topic
     */
    bool subscribe(const std::string& topic, int qos = 1);

    /**
     * @brief Publish message
     */
    bool publish(const std::string& topic, const std::string& payload, int qos = 1);

    /**
     * @brief Set message callback
     */
    void setMessageCallback(MqttMessageCallback callback);

    /**
     * @brief Publish heating status report
     * @param topic Status topic
     * @param status Decision status and current settings
     */
    bool sendHeatingStatus(const std::string& topic, const nlohmann::json& status, int qos = 1);

private:
    std::string host_;
    int port_;
    std::string client_id_;
    std::string vin_;
    bool use_tls_;
    bool verify_peer_;
    std::string ca_cert_;

    std::unique_ptr<mqtt::async_client> client_;

    // Handler and subscriptions are read from the Paho thread
    std::mutex subscriptions_mutex_;
    MqttMessageCallback message_callback_;
    std::vector<std::pair<std::string, int>> subscriptions_;  // Restored after automatic reconnect

    /**
     * @brief Callback class for Paho MQTT
     */
    class Callback : public virtual mqtt::callback {
    public:
        Callback(MqttClient* parent) : parent_(parent) {}

        void connection_lost(const std::string& cause) override;
        void message_arrived(mqtt::const_message_ptr msg) override;
        void connected(const std::string& cause) override;

    private:
        MqttClient* parent_;
    };

    std::unique_ptr<Callback> callback_;
};

#endif // MQTT_CLIENT_HPP
