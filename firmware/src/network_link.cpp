#include "network_link.h"
#include "hardware_config.h"
#include <Arduino.h>
#include <WiFi.h>

static const int CONNECT_POLLS = 10;
static const unsigned long CONNECT_POLL_MS = 1000;

static bool connectStation(const WifiNetwork& net) {
    Serial.printf("[WIFI] Connecting to '%s'", net.ssid.c_str());
    WiFi.begin(net.ssid.c_str(), net.password.c_str());

    for (int i = 0; i < CONNECT_POLLS; i++) {
        if (WiFi.status() == WL_CONNECTED) {
            Serial.println();
            return true;
        }
        // Blink while waiting
        digitalWrite(HardwareConfig::STATUS_LED_PIN, !digitalRead(HardwareConfig::STATUS_LED_PIN));
        Serial.print(".");
        delay(CONNECT_POLL_MS);
    }
    Serial.println(" failed");
    WiFi.disconnect();
    return false;
}

static void startAccessPoint(const TurntableConfig& config) {
    WiFi.mode(WIFI_AP);
    const char* password = config.apPassword.empty() ? nullptr : config.apPassword.c_str();
    if (!WiFi.softAP(config.apSsid.c_str(), password)) {
        Serial.println("[WIFI] Access point start failed!");
        return;
    }
    // LED held on while in AP mode
    digitalWrite(HardwareConfig::STATUS_LED_PIN, HIGH);
    Serial.printf("[WIFI] Access point '%s' up, IP %s\n",
        config.apSsid.c_str(), WiFi.softAPIP().toString().c_str());
}

bool networkBegin(const TurntableConfig& config) {
    pinMode(HardwareConfig::STATUS_LED_PIN, OUTPUT);

    // Hostname only sticks if set before the station interface comes up
    WiFi.setHostname(config.hostname.c_str());
    WiFi.mode(WIFI_STA);

    for (const WifiNetwork& net : config.wifiNetworks) {
        if (connectStation(net)) {
            digitalWrite(HardwareConfig::STATUS_LED_PIN, LOW);
            Serial.printf("[WIFI] Connected to '%s', IP %s\n",
                net.ssid.c_str(), WiFi.localIP().toString().c_str());
            return true;
        }
    }

    if (config.wifiNetworks.empty()) {
        Serial.println("[WIFI] No saved networks");
    } else {
        Serial.println("[WIFI] Failed to connect to any saved network");
    }
    digitalWrite(HardwareConfig::STATUS_LED_PIN, LOW);
    startAccessPoint(config);
    return false;
}
