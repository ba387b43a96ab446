#include "serial_command.h"
#include "ConfigCodec.h"
#include "MessageCodec.h"
#include "settings_store.h"
#include <Arduino.h>
#include <WiFi.h>
#include <cctype>
#include <cstring>

// Long enough for a full SETTINGS document
static char s_buf[1024];
static size_t s_len = 0;
static bool s_overflow = false;

static SharedState* s_shared = nullptr;
static CommandHandler* s_handler = nullptr;
static StatusBroadcaster* s_broadcaster = nullptr;
static const TurntableConfig* s_config = nullptr;

static void restartSoon() {
    Serial.flush();
    delay(100);
    ESP.restart();
}

// Unified STATUS command - returns all state in key: value format
static void statusSerial() {
    OperationState state = s_shared->copyState();
    SpeedTable speeds = s_shared->copySpeeds();

    Serial.printf("mode: %s\n", operationModeName(state.mode));
    Serial.printf("message: %s\n", state.message.c_str());
    Serial.printf("speed_ms: %u\n", static_cast<unsigned>(state.effectiveSpeed(speeds)));
    Serial.printf("speed_index: %u\n", static_cast<unsigned>(speeds.currentIndex()));
    Serial.printf("trigger_mode: %s\n", triggerModeName(state.triggerMode));
    if (state.mode == OperationMode::SEQUENCE) {
        Serial.printf("sequence_step: %u/%u\n",
            static_cast<unsigned>(state.progress.currentStep + 1),
            static_cast<unsigned>(state.progress.totalSteps));
    }
    Serial.printf("wifi: %s\n", WiFi.status() == WL_CONNECTED
        ? WiFi.localIP().toString().c_str()
        : WiFi.softAPIP().toString().c_str());
}

static void applySerial(const RemoteCommand& cmd) {
    if (!s_handler->apply(cmd)) {
        Serial.printf("ERR: %s not applied\n", cmd.name.c_str());
        return;
    }
    s_broadcaster->broadcast();
    Serial.println("OK");
}

static void simpleCommand(CommandType type) {
    RemoteCommand cmd;
    cmd.type = type;
    cmd.name = commandTypeName(type);
    applySerial(cmd);
}

// Raw JSON line - same path as a network client
static void jsonSerial(const char* line) {
    RemoteCommand cmd;
    std::string error;
    if (!decodeCommand(line, cmd, error)) {
        Serial.printf("ERR: %s\n", error.c_str());
        return;
    }
    applySerial(cmd);
}

static void settingsSerial(const char* json) {
    if (*json == '\0') {
        Serial.println(encodeConfig(*s_config).c_str());
        return;
    }

    std::string error;
    if (!settingsSave(json, error)) {
        Serial.printf("ERR: %s\n", error.c_str());
        return;
    }
    Serial.println("OK, rebooting");
    restartSoon();
}

static void dispatch(char* line) {
    while (isspace(static_cast<unsigned char>(*line))) line++;

    if (*line == '{') {
        jsonSerial(line);
        return;
    }

    // Uppercase the command word only; arguments may be JSON
    char* args = line;
    while (*args && !isspace(static_cast<unsigned char>(*args))) {
        *args = toupper(static_cast<unsigned char>(*args));
        args++;
    }
    if (*args) *args++ = '\0';
    while (isspace(static_cast<unsigned char>(*args))) args++;

    if (strcmp(line, "STATUS") == 0)        statusSerial();
    else if (strcmp(line, "STOP") == 0)     simpleCommand(CommandType::STOP);
    else if (strcmp(line, "SPIN") == 0)     simpleCommand(CommandType::START_SPIN);
    else if (strcmp(line, "PICTURE") == 0)  simpleCommand(CommandType::TAKE_PICTURE);
    else if (strcmp(line, "SETTINGS") == 0) settingsSerial(args);
    else if (strcmp(line, "REBOOT") == 0)   { Serial.println("OK"); restartSoon(); }
    else Serial.println("ERR: Unknown command");
}

void serialCommandInit(SharedState& shared, CommandHandler& handler,
                       StatusBroadcaster& broadcaster, const TurntableConfig& config) {
    s_shared = &shared;
    s_handler = &handler;
    s_broadcaster = &broadcaster;
    s_config = &config;
}

void serialCommandPoll() {
    if (s_shared == nullptr) return;

    while (Serial.available()) {
        char c = Serial.read();
        if (c == '\n' || c == '\r') {
            if (s_overflow) {
                Serial.println("ERR: Line too long");
            } else if (s_len > 0) {
                s_buf[s_len] = '\0';
                dispatch(s_buf);
            }
            s_len = 0;
            s_overflow = false;
        } else if (s_len < sizeof(s_buf) - 1) {
            s_buf[s_len++] = c;
        } else {
            s_overflow = true;
        }
    }
}
