#include "ConfigCodec.h"
#include <ArduinoJson.h>

// Room for four saved networks plus the fixed sections
static constexpr size_t CONFIG_DOC_SIZE = 2048;

namespace {

std::string fieldName(const char* section, const char* key) {
    return section ? std::string(section) + "." + key : std::string(key);
}

bool readString(JsonObjectConst obj, const char* section, const char* key,
                std::string& out, std::string& error) {
    JsonVariantConst value = obj[key];
    if (value.isNull()) return true;
    if (!value.is<const char*>()) {
        error = fieldName(section, key) + " must be a string";
        return false;
    }
    out = value.as<const char*>();
    return true;
}

bool readUnsigned(JsonObjectConst obj, const char* section, const char* key,
                  uint32_t& out, std::string& error) {
    JsonVariantConst value = obj[key];
    if (value.isNull()) return true;
    if (!value.is<uint32_t>()) {
        error = fieldName(section, key) + " must be a non-negative integer";
        return false;
    }
    out = value.as<uint32_t>();
    return true;
}

bool readBool(JsonObjectConst obj, const char* section, const char* key,
              bool& out, std::string& error) {
    JsonVariantConst value = obj[key];
    if (value.isNull()) return true;
    if (!value.is<bool>()) {
        error = fieldName(section, key) + " must be true or false";
        return false;
    }
    out = value.as<bool>();
    return true;
}

// Absent sections are fine; present ones must be objects
bool readSection(JsonObjectConst root, const char* key, JsonObjectConst& out, std::string& error) {
    JsonVariantConst value = root[key];
    if (value.isNull()) return true;
    if (!value.is<JsonObjectConst>()) {
        error = std::string(key) + " must be an object";
        return false;
    }
    out = value.as<JsonObjectConst>();
    return true;
}

} // anonymous namespace

bool decodeConfig(const std::string& json, TurntableConfig& out, std::string& error) {
    DynamicJsonDocument doc(CONFIG_DOC_SIZE);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        error = std::string("invalid JSON: ") + err.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        error = "settings must be a JSON object";
        return false;
    }
    JsonObjectConst root = doc.as<JsonObjectConst>();

    TurntableConfig config;
    if (!readString(root, nullptr, "hostname", config.hostname, error)) return false;

    JsonObjectConst hardware;
    if (!readSection(root, "hardware", hardware, error)) return false;
    if (!hardware.isNull()) {
        std::string version = config.infraredFitted ? "with_ir" : "wired_only";
        if (!readString(hardware, "hardware", "version", version, error)) return false;
        if (version == "with_ir") {
            config.infraredFitted = true;
        } else if (version == "wired_only") {
            config.infraredFitted = false;
        } else {
            error = "hardware.version must be \"with_ir\" or \"wired_only\"";
            return false;
        }
    }

    JsonVariantConst networks = root["wifi_networks"];
    if (!networks.isNull()) {
        if (!networks.is<JsonArrayConst>()) {
            error = "wifi_networks must be an array";
            return false;
        }
        for (JsonVariantConst entry : networks.as<JsonArrayConst>()) {
            if (!entry.is<JsonObjectConst>()) {
                error = "wifi_networks entries must be objects";
                return false;
            }
            WifiNetwork net;
            JsonObjectConst netObj = entry.as<JsonObjectConst>();
            if (!readString(netObj, "wifi_networks", "ssid", net.ssid, error)) return false;
            if (!readString(netObj, "wifi_networks", "password", net.password, error)) return false;
            config.wifiNetworks.push_back(net);
        }
    }

    JsonObjectConst ap;
    if (!readSection(root, "ap_settings", ap, error)) return false;
    if (!ap.isNull()) {
        if (!readString(ap, "ap_settings", "ssid", config.apSsid, error)) return false;
        if (!readString(ap, "ap_settings", "password", config.apPassword, error)) return false;
    }

    JsonObjectConst speeds;
    if (!readSection(root, "speeds_ms", speeds, error)) return false;
    if (!speeds.isNull()) {
        if (!readUnsigned(speeds, "speeds_ms", "slow", config.slowSpeedMs, error)) return false;
        if (!readUnsigned(speeds, "speeds_ms", "normal", config.normalSpeedMs, error)) return false;
        if (!readUnsigned(speeds, "speeds_ms", "fast", config.fastSpeedMs, error)) return false;
    }

    JsonObjectConst delays;
    if (!readSection(root, "photo_delays_ms", delays, error)) return false;
    if (!delays.isNull()) {
        if (!readUnsigned(delays, "photo_delays_ms", "short", config.shortDelayMs, error)) return false;
        if (!readUnsigned(delays, "photo_delays_ms", "medium", config.mediumDelayMs, error)) return false;
        if (!readUnsigned(delays, "photo_delays_ms", "long", config.longDelayMs, error)) return false;
    }

    JsonObjectConst startup;
    if (!readSection(root, "startup", startup, error)) return false;
    if (!startup.isNull()) {
        if (!readBool(startup, "startup", "autospin", config.autospin, error)) return false;
        JsonVariantConst trigger = startup["trigger_mode"];
        if (!trigger.isNull() && !parseTriggerMode(trigger.as<const char*>(), config.triggerMode)) {
            error = "startup.trigger_mode must be \"WIRED\" or \"IR\"";
            return false;
        }
    }

    if (!config.validate(error)) return false;

    out = config;
    return true;
}

std::string encodeConfig(const TurntableConfig& config) {
    DynamicJsonDocument doc(CONFIG_DOC_SIZE);

    doc["hostname"] = config.hostname;
    doc["hardware"]["version"] = config.infraredFitted ? "with_ir" : "wired_only";

    JsonArray networks = doc.createNestedArray("wifi_networks");
    for (const WifiNetwork& net : config.wifiNetworks) {
        JsonObject entry = networks.createNestedObject();
        entry["ssid"] = net.ssid;
        entry["password"] = net.password;
    }

    doc["ap_settings"]["ssid"] = config.apSsid;
    doc["ap_settings"]["password"] = config.apPassword;

    doc["speeds_ms"]["slow"] = config.slowSpeedMs;
    doc["speeds_ms"]["normal"] = config.normalSpeedMs;
    doc["speeds_ms"]["fast"] = config.fastSpeedMs;

    doc["photo_delays_ms"]["short"] = config.shortDelayMs;
    doc["photo_delays_ms"]["medium"] = config.mediumDelayMs;
    doc["photo_delays_ms"]["long"] = config.longDelayMs;

    doc["startup"]["autospin"] = config.autospin;
    doc["startup"]["trigger_mode"] = triggerModeName(config.triggerMode);

    std::string json;
    serializeJson(doc, json);
    return json;
}
