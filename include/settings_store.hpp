/**
 * @file settings_store.hpp
 * @brief Heating Settings Store
 *
 * Thread-safe holder of the user heating settings.
 * Every mutation bumps a revision counter; the decision engine treats a new
 * revision as a fresh decision epoch.
 *
 * Key space (JSON):
 *   seatAutoHeatMode        off | driver | passenger | both
 *   adaptiveHeating         bool
 *   heatingLevel            0..3
 *   checkTempOnceOnStartup  bool
 *   autoOffTimerMinutes     0..20
 *   temperatureSource       cabin | ambient
 *   temperatureThreshold    int °C
 */

#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include "heating_settings.hpp"

/**
 * @brief Settings read atomically together with their revision
 */
struct SettingsSnapshot {
    HeatingSettings settings;
    uint64_t revision = 0;
};

class SettingsStore {
public:
    SettingsStore();
    explicit SettingsStore(const HeatingSettings& initial);

    /**
     * @brief Read all fields at once
     */
    SettingsSnapshot snapshot() const;

    uint64_t getRevision() const;

    // ========================================
    // Mutators (each bumps the revision)
    // ========================================

    void setMode(HeatingMode mode);
    void setAdaptive(bool enabled);
    void setHeatingLevel(int level);
    void setCheckOnceOnStartup(bool enabled);
    void setAutoOffTimer(int minutes);
    void setTemperatureSource(TemperatureSource source);
    void setThreshold(int celsius);

    /**
     * @brief Apply keys present in a JSON object
     * @param values Object using the settings key space
     * @return false if a key has an invalid value (nothing is applied then)
     */
    bool loadFromJson(const nlohmann::json& values);

    /**
     * @brief Export current settings using the settings key space
     */
    nlohmann::json toJson() const;

    /**
     * @brief Called after every mutation (outside the lock)
     */
    void setChangeCallback(std::function<void()> callback);

private:
    mutable std::mutex mutex_;
    HeatingSettings settings_;
    uint64_t revision_;
    std::function<void()> change_callback_;

    template <typename Fn>
    void mutate(Fn fn);
};

#endif // SETTINGS_STORE_HPP
