/**
 * @file heating_settings.cpp
 * @brief Seat Heating Settings Conversions
 */

#include "heating_settings.hpp"

std::string toString(HeatingMode mode) {
    switch (mode) {
        case HeatingMode::DRIVER:
            return "driver";
        case HeatingMode::PASSENGER:
            return "passenger";
        case HeatingMode::BOTH:
            return "both";
        default:
            return "off";
    }
}

std::string toString(SeatZone zone) {
    return zone == SeatZone::DRIVER ? "driver" : "passenger";
}

std::string toString(TemperatureSource source) {
    return source == TemperatureSource::AMBIENT ? "ambient" : "cabin";
}

bool parseHeatingMode(const std::string& key, HeatingMode& mode) {
    if (key == "off") {
        mode = HeatingMode::OFF;
    } else if (key == "driver") {
        mode = HeatingMode::DRIVER;
    } else if (key == "passenger") {
        mode = HeatingMode::PASSENGER;
    } else if (key == "both") {
        mode = HeatingMode::BOTH;
    } else {
        return false;
    }
    return true;
}

bool parseTemperatureSource(const std::string& key, TemperatureSource& source) {
    if (key == "cabin") {
        source = TemperatureSource::CABIN;
    } else if (key == "ambient") {
        source = TemperatureSource::AMBIENT;
    } else {
        return false;
    }
    return true;
}
