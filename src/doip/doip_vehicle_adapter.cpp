/**
 * @file doip_vehicle_adapter.cpp
 * @brief DoIP/UDS Vehicle Adapters Implementation
 */

#include "doip_vehicle_adapter.hpp"
#include <iostream>

std::optional<float> decodeTemperatureRecord(const std::vector<uint8_t>& record) {
    if (record.size() < 2) {
        return std::nullopt;
    }

    uint16_t raw = (static_cast<uint16_t>(record[0]) << 8) | record[1];
    if (raw == TEMPERATURE_NOT_AVAILABLE) {
        return std::nullopt;
    }

    return static_cast<float>(static_cast<int16_t>(raw)) / 10.0f;
}

// ============================================================================
// DoIPSeatHeater
// ============================================================================

DoIPSeatHeater::DoIPSeatHeater(std::shared_ptr<DoIPClient> doip_client, uint16_t seat_heater_did)
    : doip_client_(doip_client), seat_heater_did_(seat_heater_did) {
}

uint16_t DoIPSeatHeater::didForZone(int zone_id) const {
    return static_cast<uint16_t>(seat_heater_did_ + zone_id);
}

bool DoIPSeatHeater::isAvailable() {
    if (!doip_client_) {
        return false;
    }
    if (doip_client_->isActive()) {
        return true;
    }
    return doip_client_->connect();
}

bool DoIPSeatHeater::writeLevel(int zone_id, int level) {
    if (level < 0 || level > 3) {
        std::cerr << "[DoIP] Seat heater level out of range: " << level << "\n";
        return false;
    }

    std::vector<uint8_t> record = {static_cast<uint8_t>(level)};
    return doip_client_->writeDataByIdentifier(didForZone(zone_id), record);
}

std::optional<int> DoIPSeatHeater::readLevel(int zone_id) {
    std::vector<uint8_t> record;
    if (!doip_client_->readDataByIdentifier(didForZone(zone_id), record) || record.empty()) {
        return std::nullopt;
    }
    return static_cast<int>(record[0]);
}

// ============================================================================
// DoIPVehicleSignals
// ============================================================================

DoIPVehicleSignals::DoIPVehicleSignals(std::shared_ptr<DoIPClient> doip_client,
                                       uint16_t ignition_did,
                                       uint16_t cabin_temp_did,
                                       uint16_t ambient_temp_did)
    : doip_client_(doip_client),
      ignition_did_(ignition_did),
      cabin_temp_did_(cabin_temp_did),
      ambient_temp_did_(ambient_temp_did) {
}

bool DoIPVehicleSignals::ensureConnected() {
    if (!doip_client_) {
        return false;
    }
    return doip_client_->isActive() || doip_client_->connect();
}

std::optional<int> DoIPVehicleSignals::readIgnitionRaw() {
    if (!ensureConnected()) {
        return std::nullopt;
    }

    std::vector<uint8_t> record;
    if (!doip_client_->readDataByIdentifier(ignition_did_, record) || record.empty()) {
        return std::nullopt;
    }
    return static_cast<int>(record[0]);
}

std::optional<float> DoIPVehicleSignals::readCabinTemperature() {
    return readTemperature(cabin_temp_did_);
}

std::optional<float> DoIPVehicleSignals::readAmbientTemperature() {
    return readTemperature(ambient_temp_did_);
}

std::optional<float> DoIPVehicleSignals::readTemperature(uint16_t did) {
    if (!ensureConnected()) {
        return std::nullopt;
    }

    std::vector<uint8_t> record;
    if (!doip_client_->readDataByIdentifier(did, record)) {
        return std::nullopt;
    }
    return decodeTemperatureRecord(record);
}
