#ifndef TURNTABLE_CONFIG_CODEC_H
#define TURNTABLE_CONFIG_CODEC_H

#include <string>
#include "TurntableConfig.h"

/**
 * Settings document, as stored in NVS and printed by the SETTINGS command:
 *
 * {
 *   "hostname": "smart-turntable",
 *   "hardware": {"version": "with_ir"},
 *   "wifi_networks": [{"ssid": "...", "password": "..."}],
 *   "ap_settings": {"ssid": "SmartTurntableAP", "password": "..."},
 *   "speeds_ms": {"slow": 13, "normal": 4, "fast": 1},
 *   "photo_delays_ms": {"short": 500, "medium": 1000, "long": 2000},
 *   "startup": {"autospin": true, "trigger_mode": "WIRED"}
 * }
 *
 * Missing keys keep their defaults.
 */

/**
 * Parse and validate a settings document
 * @param json  Settings text
 * @param out   Receives the settings (only on success)
 * @param error Reason for rejection
 * @return false on bad JSON, wrong field types or failed validation
 */
bool decodeConfig(const std::string& json, TurntableConfig& out, std::string& error);

std::string encodeConfig(const TurntableConfig& config);

#endif // TURNTABLE_CONFIG_CODEC_H
