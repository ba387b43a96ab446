#include "MessageCodec.h"
#include <ArduinoJson.h>

// Largest command is start_photo_sequence with four members
static constexpr size_t COMMAND_DOC_SIZE = 256;
static constexpr size_t STATUS_DOC_SIZE = 384;

bool decodeCommand(const std::string& line, RemoteCommand& out, std::string& error) {
    StaticJsonDocument<COMMAND_DOC_SIZE> doc;
    DeserializationError err = deserializeJson(doc, line);
    if (err) {
        error = std::string("invalid JSON: ") + err.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        error = "command must be a JSON object";
        return false;
    }

    JsonObject obj = doc.as<JsonObject>();
    const char* name = obj["command"];
    if (name == nullptr) {
        error = "missing \"command\" string";
        return false;
    }

    RemoteCommand cmd;
    cmd.name = name;
    cmd.type = commandTypeFromName(name);

    JsonVariant speed = obj["speed"];
    if (!speed.isNull()) {
        if (!speed.is<int>() || speed.as<int>() <= 0) {
            error = "\"speed\" must be a positive integer";
            return false;
        }
        cmd.hasSpeed = true;
        cmd.speed = static_cast<step_interval_t>(speed.as<int>());
    }

    // "deg" is the wire name; "degrees" is accepted as an alias
    const char* degreesKey = obj.containsKey("deg") ? "deg" : "degrees";
    JsonVariant degrees = obj[degreesKey];
    if (!degrees.isNull()) {
        if (!degrees.is<float>()) {
            error = "\"deg\" must be a number";
            return false;
        }
        cmd.hasDegrees = true;
        cmd.degrees = degrees.as<float>();
    }

    JsonVariant delay = obj["delay"];
    if (!delay.isNull()) {
        if (!delay.is<int>() || delay.as<int>() < 0) {
            error = "\"delay\" must be a non-negative integer";
            return false;
        }
        cmd.hasDelay = true;
        cmd.delayMs = static_cast<uint32_t>(delay.as<int>());
    }

    // Unknown trigger modes leave hasTriggerMode false -> handler no-op
    const char* mode = obj["mode"];
    cmd.hasTriggerMode = parseTriggerMode(mode, cmd.triggerMode);

    JsonVariant state = obj["state"];
    if (state.is<bool>()) {
        cmd.wiredState = state.as<bool>();
    } else if (state.is<int>()) {
        cmd.wiredState = state.as<int>() != 0;
    }

    out = cmd;
    return true;
}

std::string encodeStatus(const StatusSnapshot& snapshot) {
    StaticJsonDocument<STATUS_DOC_SIZE> doc;
    doc["message"] = snapshot.message;
    doc["mode"] = operationModeName(snapshot.mode);
    doc["speed"] = snapshot.speed;
    doc["trigger_mode"] = triggerModeName(snapshot.triggerMode);

    std::string payload;
    serializeJson(doc, payload);
    return payload;
}
