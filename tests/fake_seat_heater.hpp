/**
 * @file fake_seat_heater.hpp
 * @brief In-memory seat heater for unit tests
 */

#ifndef FAKE_SEAT_HEATER_HPP
#define FAKE_SEAT_HEATER_HPP

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include "seat_heater_interface.hpp"

class FakeSeatHeater : public SeatHeaterInterface {
public:
    bool isAvailable() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    bool writeLevel(int zone_id, int level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.emplace_back(zone_id, level);
        if (failing_zones_.count(zone_id)) {
            return false;
        }
        levels_[zone_id] = level;
        return true;
    }

    std::optional<int> readLevel(int zone_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreadable_zones_.count(zone_id)) {
            return std::nullopt;
        }
        auto it = levels_.find(zone_id);
        return it == levels_.end() ? 0 : it->second;
    }

    // ---- test controls ----

    void setAvailable(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
    }

    void setWriteFailure(int zone_id, bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            failing_zones_.insert(zone_id);
        } else {
            failing_zones_.erase(zone_id);
        }
    }

    void setReadFailure(int zone_id, bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            unreadable_zones_.insert(zone_id);
        } else {
            unreadable_zones_.erase(zone_id);
        }
    }

    // Simulates the occupant changing the level on the seat switch
    void setHardwareLevel(int zone_id, int level) {
        std::lock_guard<std::mutex> lock(mutex_);
        levels_[zone_id] = level;
    }

    int level(int zone_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = levels_.find(zone_id);
        return it == levels_.end() ? 0 : it->second;
    }

    std::vector<std::pair<int, int>> writes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    void clearWrites() {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.clear();
    }

private:
    std::mutex mutex_;
    bool available_ = true;
    std::map<int, int> levels_;
    std::set<int> failing_zones_;
    std::set<int> unreadable_zones_;
    std::vector<std::pair<int, int>> writes_;
};

#endif // FAKE_SEAT_HEATER_HPP
