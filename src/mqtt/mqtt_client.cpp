/**
 * @file mqtt_client.cpp
 * @brief Paho MQTT C++ link: settings commands in, heating status out
 */

#include "mqtt_client.hpp"
#include <chrono>
#include <ctime>
#include <iostream>

using json = nlohmann::json;

// ============================================================================
// Paho callbacks (run on the Paho client thread)
// ============================================================================

void MqttClient::Callback::connection_lost(const std::string& cause) {
    std::cerr << "[MQTT] ✗ Broker link lost"
              << (cause.empty() ? std::string() : ": " + cause) << std::endl;
}

void MqttClient::Callback::message_arrived(mqtt::const_message_ptr msg) {
    MqttMessageCallback handler;
    {
        std::lock_guard<std::mutex> lock(parent_->subscriptions_mutex_);
        handler = parent_->message_callback_;
    }

    if (!handler) {
        std::cerr << "[MQTT] No handler, dropped message on " << msg->get_topic() << std::endl;
        return;
    }
    handler(msg->get_topic(), msg->to_string());
}

void MqttClient::Callback::connected(const std::string& /*cause*/) {
    std::vector<std::pair<std::string, int>> restore;
    {
        std::lock_guard<std::mutex> lock(parent_->subscriptions_mutex_);
        restore = parent_->subscriptions_;
    }
    if (restore.empty()) {
        return;
    }

    std::cout << "[MQTT] Link up again, restoring " << restore.size() << " subscription(s)\n";
    for (const auto& entry : restore) {
        try {
            parent_->client_->subscribe(entry.first, entry.second);
        } catch (const mqtt::exception& e) {
            std::cerr << "[MQTT] ✗ Could not restore " << entry.first << ": " << e.what() << std::endl;
        }
    }
}

// ============================================================================
// MqttClient
// ============================================================================

MqttClient::MqttClient(const std::string& host, int port, const std::string& client_id,
                       const std::string& vin, bool use_tls, bool verify_peer,
                       const std::string& ca_cert)
    : host_(host), port_(port), client_id_(client_id), vin_(vin),
      use_tls_(use_tls), verify_peer_(verify_peer), ca_cert_(ca_cert),
      client_(std::make_unique<mqtt::async_client>(
          (use_tls ? "ssl://" : "tcp://") + host + ":" + std::to_string(port), client_id)),
      callback_(std::make_unique<Callback>(this)) {
    client_->set_callback(*callback_);
}

MqttClient::~MqttClient() {
    disconnect();
}

bool MqttClient::connect(int keep_alive_sec) {
    auto builder = mqtt::connect_options_builder()
        .keep_alive_interval(std::chrono::seconds(keep_alive_sec))
        .clean_session()
        .automatic_reconnect();

    if (use_tls_) {
        builder.ssl(mqtt::ssl_options_builder()
            .trust_store(ca_cert_)
            .enable_server_cert_auth(verify_peer_)
            .finalize());
    }

    std::cout << "[MQTT] Connecting to " << host_ << ":" << port_
              << (use_tls_ ? " (TLS)" : "") << " as " << client_id_ << "...\n";

    try {
        client_->connect(builder.finalize())->wait();
    } catch (const mqtt::exception& e) {
        std::cerr << "[MQTT] ✗ Broker unreachable: " << e.what() << std::endl;
        return false;
    }

    if (!isConnected()) {
        std::cerr << "[MQTT] ✗ Broker refused the connection\n";
        return false;
    }

    std::cout << "[MQTT] ✓ Connected to " << host_ << "\n";
    return true;
}

void MqttClient::disconnect() {
    if (!isConnected()) {
        return;
    }

    try {
        client_->disconnect()->wait();
        std::cout << "[MQTT] ✓ Disconnected from " << host_ << "\n";
    } catch (const mqtt::exception& e) {
        std::cerr << "[MQTT] ✗ Disconnect failed: " << e.what() << std::endl;
    }
}

bool MqttClient::isConnected() const {
    return client_->is_connected();
}

bool MqttClient::subscribe(const std::string& topic, int qos) {
    if (!isConnected()) {
        std::cerr << "[MQTT] Cannot subscribe to " << topic << ": offline\n";
        return false;
    }

    try {
        client_->subscribe(topic, qos)->wait();
    } catch (const mqtt::exception& e) {
        std::cerr << "[MQTT] ✗ Subscription to " << topic << " failed: " << e.what() << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.emplace_back(topic, qos);
    }

    std::cout << "[MQTT] ✓ Listening on " << topic << " (QoS " << qos << ")\n";
    return true;
}

bool MqttClient::publish(const std::string& topic, const std::string& payload, int qos) {
    if (!isConnected()) {
        std::cerr << "[MQTT] Cannot publish to " << topic << ": offline\n";
        return false;
    }

    try {
        client_->publish(topic, payload.data(), payload.size(), qos, false);
    } catch (const mqtt::exception& e) {
        std::cerr << "[MQTT] ✗ Publish to " << topic << " failed: " << e.what() << std::endl;
        return false;
    }
    return true;
}

void MqttClient::setMessageCallback(MqttMessageCallback callback) {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    message_callback_ = std::move(callback);
}

// ============================================================================
// Status Reporting
// ============================================================================

bool MqttClient::sendHeatingStatus(const std::string& topic, const json& status, int qos) {
    json envelope;
    envelope["msg_type"] = "seat_heating_status";
    envelope["timestamp"] = static_cast<int64_t>(std::time(nullptr));
    envelope["vin"] = vin_;
    envelope["client_id"] = client_id_;
    envelope["status"] = status;

    return publish(topic, envelope.dump(), qos);
}
