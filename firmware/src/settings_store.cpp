#include "settings_store.h"
#include "ConfigCodec.h"
#include <Arduino.h>
#include <Preferences.h>

static const char* NVS_NAMESPACE = "turntable";
static const char* NVS_KEY = "config";

static bool writeSettings(Preferences& prefs, const TurntableConfig& config) {
    std::string json = encodeConfig(config);
    return prefs.putString(NVS_KEY, json.c_str()) == json.size();
}

TurntableConfig settingsLoad() {
    TurntableConfig defaults;

    Preferences prefs;
    if (!prefs.begin(NVS_NAMESPACE, false)) {
        Serial.println("[SETTINGS] NVS open failed, using defaults");
        return defaults;
    }

    String stored = prefs.getString(NVS_KEY, "");
    if (stored.length() > 0) {
        TurntableConfig config;
        std::string error;
        if (decodeConfig(stored.c_str(), config, error)) {
            prefs.end();
            Serial.printf("[SETTINGS] Loaded (%u bytes)\n", stored.length());
            return config;
        }
        Serial.printf("[SETTINGS] Stored settings rejected: %s\n", error.c_str());
    } else {
        Serial.println("[SETTINGS] No stored settings");
    }

    if (writeSettings(prefs, defaults)) {
        Serial.println("[SETTINGS] Defaults written");
    } else {
        Serial.println("[SETTINGS] Failed to write defaults!");
    }
    prefs.end();
    return defaults;
}

bool settingsSave(const std::string& json, std::string& error) {
    TurntableConfig config;
    if (!decodeConfig(json, config, error)) {
        return false;
    }

    Preferences prefs;
    if (!prefs.begin(NVS_NAMESPACE, false)) {
        error = "NVS open failed";
        return false;
    }
    bool written = writeSettings(prefs, config);
    prefs.end();

    if (!written) {
        error = "NVS write failed";
        return false;
    }
    Serial.println("[SETTINGS] Saved");
    return true;
}
