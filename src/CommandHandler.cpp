#include "CommandHandler.h"
#include <cstring>

namespace {

struct CommandName {
    const char* name;
    CommandType type;
};

const CommandName COMMAND_NAMES[] = {
    {"set_trigger_mode",     CommandType::SET_TRIGGER_MODE},
    {"start_spin",           CommandType::START_SPIN},
    {"set_speed",            CommandType::SET_SPEED},
    {"start_photo_sequence", CommandType::START_PHOTO_SEQUENCE},
    {"take_picture",         CommandType::TAKE_PICTURE},
    {"stop",                 CommandType::STOP},
    {"debug_ir_trigger",     CommandType::DEBUG_IR_TRIGGER},
    {"debug_wired_shutter",  CommandType::DEBUG_WIRED_SHUTTER},
};

} // anonymous namespace

CommandType commandTypeFromName(const char* name) {
    if (name == nullptr) return CommandType::UNKNOWN;
    for (const CommandName& entry : COMMAND_NAMES) {
        if (strcmp(entry.name, name) == 0) return entry.type;
    }
    return CommandType::UNKNOWN;
}

const char* commandTypeName(CommandType type) {
    for (const CommandName& entry : COMMAND_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "unknown";
}

bool CommandHandler::apply(const RemoteCommand& cmd) {
    switch (cmd.type) {
        case CommandType::SET_TRIGGER_MODE: {
            if (!cmd.hasTriggerMode) return false;
            SharedState::Access access = shared_.lock();
            access.state().triggerMode = cmd.triggerMode;
            return true;
        }
        case CommandType::START_SPIN: {
            step_interval_t speed = speedOrDefault(cmd);
            SharedState::Access access = shared_.lock();
            OperationParams params = access.state().params;
            params.hasSpeed = true;
            params.speed = speed;
            access.speeds().select(speed);
            access.state().install(OperationMode::SPIN, params);
            return true;
        }
        case CommandType::SET_SPEED: {
            step_interval_t speed = speedOrDefault(cmd);
            SharedState::Access access = shared_.lock();
            if (access.state().mode != OperationMode::SPIN) return false;
            access.state().params.hasSpeed = true;
            access.state().params.speed = speed;
            access.speeds().select(speed);
            return true;
        }
        case CommandType::START_PHOTO_SEQUENCE: {
            OperationParams params;
            params.hasSpeed = true;
            params.speed = speedOrDefault(cmd);
            params.degreesPerStep = cmd.hasDegrees ? cmd.degrees : defaults_.degrees;
            params.delayMs = cmd.hasDelay ? cmd.delayMs : defaults_.delayMs;
            SharedState::Access access = shared_.lock();
            access.state().install(OperationMode::SEQUENCE, params);
            return true;
        }
        case CommandType::TAKE_PICTURE: {
            SharedState::Access access = shared_.lock();
            access.state().install(OperationMode::PICTURE);
            return true;
        }
        case CommandType::STOP: {
            SharedState::Access access = shared_.lock();
            access.state().install(OperationMode::IDLE);
            return true;
        }
        case CommandType::DEBUG_IR_TRIGGER:
            return camera_.sendInfraredDirect();
        case CommandType::DEBUG_WIRED_SHUTTER:
            camera_.setWiredDirect(cmd.wiredState);
            return true;
        case CommandType::UNKNOWN:
        default:
            return false;
    }
}
