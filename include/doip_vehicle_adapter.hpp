/**
 * @file doip_vehicle_adapter.hpp
 * @brief DoIP/UDS Vehicle Adapters
 *
 * Binds the seat heater interface and the vehicle signal reader to the ZGW.
 *
 * Data identifiers (record layout):
 *   ignition DID        1 byte raw VehicleIgnitionState
 *   temperature DIDs    int16 big-endian, 0.1°C, 0x7FFF = not available
 *   seat heater DID     base + zone id, 1 byte level 0..3
 */

#ifndef DOIP_VEHICLE_ADAPTER_HPP
#define DOIP_VEHICLE_ADAPTER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include "doip_client.hpp"
#include "seat_heater_interface.hpp"
#include "vehicle_signal_monitor.hpp"

constexpr uint16_t TEMPERATURE_NOT_AVAILABLE = 0x7FFF;

/**
 * @brief Decode a temperature record (int16 BE, 0.1°C)
 * @return °C, or empty for short records and the not-available marker
 */
std::optional<float> decodeTemperatureRecord(const std::vector<uint8_t>& record);

/**
 * @brief Seat heater control over UDS Read/WriteDataByIdentifier
 */
class DoIPSeatHeater : public SeatHeaterInterface {
public:
    /**
     * @brief Constructor
     * @param doip_client Shared DoIP client
     * @param seat_heater_did Base DID, zone id is added per zone
     */
    DoIPSeatHeater(std::shared_ptr<DoIPClient> doip_client, uint16_t seat_heater_did);

    bool isAvailable() override;
    bool writeLevel(int zone_id, int level) override;
    std::optional<int> readLevel(int zone_id) override;

private:
    std::shared_ptr<DoIPClient> doip_client_;
    uint16_t seat_heater_did_;

    uint16_t didForZone(int zone_id) const;
};

/**
 * @brief Vehicle signal reads over UDS ReadDataByIdentifier
 */
class DoIPVehicleSignals : public VehicleSignalReader {
public:
    DoIPVehicleSignals(std::shared_ptr<DoIPClient> doip_client,
                       uint16_t ignition_did,
                       uint16_t cabin_temp_did,
                       uint16_t ambient_temp_did);

    std::optional<int> readIgnitionRaw() override;
    std::optional<float> readCabinTemperature() override;
    std::optional<float> readAmbientTemperature() override;

private:
    std::shared_ptr<DoIPClient> doip_client_;
    uint16_t ignition_did_;
    uint16_t cabin_temp_did_;
    uint16_t ambient_temp_did_;

    /**
     * @brief Connect lazily; a dead link is retried on the next poll
     */
    bool ensureConnected();

    std::optional<float> readTemperature(uint16_t did);
};

#endif // DOIP_VEHICLE_ADAPTER_HPP
