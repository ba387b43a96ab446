#include "TurntableConfig.h"

CommandDefaults TurntableConfig::commandDefaults() const {
    CommandDefaults defaults;
    defaults.speed = normalSpeedMs;
    defaults.delayMs = mediumDelayMs;
    return defaults;
}

bool TurntableConfig::validate(std::string& error) const {
    if (hostname.empty()) {
        error = "hostname must not be empty";
        return false;
    }
    if (!SpeedTable::isValid(speedList())) {
        error = "speeds_ms must be three distinct non-zero values";
        return false;
    }
    if (shortDelayMs == 0 || mediumDelayMs == 0 || longDelayMs == 0) {
        error = "photo_delays_ms must be non-zero";
        return false;
    }
    for (const WifiNetwork& net : wifiNetworks) {
        if (net.ssid.empty()) {
            error = "wifi_networks entry has an empty ssid";
            return false;
        }
    }
    if (apSsid.empty()) {
        error = "ap_settings.ssid must not be empty";
        return false;
    }
    // WPA2 passphrases are 8-63 characters
    if (!apPassword.empty() && (apPassword.size() < 8 || apPassword.size() > 63)) {
        error = "ap_settings.password must be 8-63 characters";
        return false;
    }
    if (triggerMode == TriggerMode::IR && !infraredFitted) {
        error = "startup.trigger_mode is IR but hardware.version is wired_only";
        return false;
    }
    return true;
}
