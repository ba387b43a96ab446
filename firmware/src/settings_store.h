#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <string>
#include "TurntableConfig.h"

/**
 * Load settings from NVS
 * Missing or invalid settings are replaced by the defaults, which are
 * written back so the next boot reads a valid document.
 */
TurntableConfig settingsLoad();

/**
 * Validate and persist a settings document
 * @param json  Full settings document
 * @param error Reason for rejection
 * @return false if invalid or the NVS write failed (nothing stored)
 */
bool settingsSave(const std::string& json, std::string& error);

#endif
