/**
 * @file seat_heater_interface.hpp
 * @brief Seat Heater Control Interface
 *
 * Low-level access to the seat heater level of a vendor zone id.
 * Implemented over DoIP/UDS (DoIPSeatHeater) and by in-memory doubles in tests.
 */

#ifndef SEAT_HEATER_INTERFACE_HPP
#define SEAT_HEATER_INTERFACE_HPP

#include <optional>

class SeatHeaterInterface {
public:
    virtual ~SeatHeaterInterface() = default;

    /**
     * @brief Check whether the vehicle side can be reached at all
     */
    virtual bool isAvailable() = 0;

    /**
     * @brief Write heater level (0..3) for a zone
     * @return true if the write was accepted
     */
    virtual bool writeLevel(int zone_id, int level) = 0;

    /**
     * @brief Read current heater level of a zone
     * @return Level, or empty if the read failed
     */
    virtual std::optional<int> readLevel(int zone_id) = 0;
};

#endif // SEAT_HEATER_INTERFACE_HPP
