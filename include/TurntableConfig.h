#ifndef TURNTABLE_CONFIG_H
#define TURNTABLE_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>
#include "CommandHandler.h"
#include "OperationState.h"
#include "SpeedTable.h"
#include "types.h"

struct WifiNetwork {
    std::string ssid;
    std::string password;
};

/**
 * Runtime settings, persisted as JSON (see ConfigCodec.h)
 *
 * Defaults match a fresh board: wired + IR hardware, spin on boot.
 */
struct TurntableConfig {
    std::string hostname = "smart-turntable";

    // hardware.version: "with_ir" fits the IR LED, "wired_only" does not
    bool infraredFitted = true;

    std::vector<WifiNetwork> wifiNetworks;
    std::string apSsid = "SmartTurntableAP";
    std::string apPassword = "your_strong_password";

    // speeds_ms: slow -> fast, in SpeedTable order
    step_interval_t slowSpeedMs = 13;
    step_interval_t normalSpeedMs = 4;
    step_interval_t fastSpeedMs = 1;

    // photo_delays_ms
    uint32_t shortDelayMs = 500;
    uint32_t mediumDelayMs = 1000;
    uint32_t longDelayMs = 2000;

    // startup
    bool autospin = true;
    TriggerMode triggerMode = TriggerMode::WIRED;

    std::vector<step_interval_t> speedList() const {
        return {slowSpeedMs, normalSpeedMs, fastSpeedMs};
    }

    // Table starts on the "normal" entry
    SpeedTable speedTable() const { return SpeedTable(speedList(), SpeedTable::DEFAULT_INDEX); }

    CommandDefaults commandDefaults() const;

    /**
     * Check the settings can drive the core
     * @param error Receives the first problem found
     * @return true if valid
     */
    bool validate(std::string& error) const;
};

#endif // TURNTABLE_CONFIG_H
