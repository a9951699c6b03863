/**
 * @file vehicle_state.cpp
 * @brief Vehicle State Types Implementation
 */

#include "vehicle_state.hpp"

bool isIgnitionOn(IgnitionState state) {
    return state == IgnitionState::RUN || state == IgnitionState::START;
}

bool isIgnitionOff(IgnitionState state) {
    return state == IgnitionState::OFF || state == IgnitionState::UNKNOWN;
}

IgnitionState ignitionFromRaw(int raw) {
    switch (raw) {
        case IGNITION_RAW_LOCK:
        case IGNITION_RAW_OFF:
            return IgnitionState::OFF;
        case IGNITION_RAW_ACC:
            return IgnitionState::ACCESSORY;
        case IGNITION_RAW_ON:
            return IgnitionState::RUN;
        case IGNITION_RAW_START:
            return IgnitionState::START;
        default:
            return IgnitionState::UNKNOWN;
    }
}

std::string toString(IgnitionState state) {
    switch (state) {
        case IgnitionState::OFF:
            return "OFF";
        case IgnitionState::ACCESSORY:
            return "ACCESSORY";
        case IgnitionState::START:
            return "START";
        case IgnitionState::RUN:
            return "RUN";
        default:
            return "UNKNOWN";
    }
}
