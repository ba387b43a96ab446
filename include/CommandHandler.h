#ifndef TURNTABLE_COMMAND_HANDLER_H
#define TURNTABLE_COMMAND_HANDLER_H

#include <cstdint>
#include <string>
#include "CameraTrigger.h"
#include "OperationState.h"

enum class CommandType : uint8_t {
    UNKNOWN = 0,
    SET_TRIGGER_MODE,
    START_SPIN,
    SET_SPEED,
    START_PHOTO_SEQUENCE,
    TAKE_PICTURE,
    STOP,
    DEBUG_IR_TRIGGER,     // Fire IR code directly, no state change
    DEBUG_WIRED_SHUTTER,  // Drive wired output directly, no state change
};

/**
 * Map a wire name ("start_spin") to its CommandType
 * @return CommandType::UNKNOWN for unrecognized names
 */
CommandType commandTypeFromName(const char* name);
const char* commandTypeName(CommandType type);

/**
 * Parsed remote command; absent optional fields take configured defaults
 */
struct RemoteCommand {
    CommandType type = CommandType::UNKNOWN;
    std::string name;  // As received, for diagnostics

    bool hasSpeed = false;
    step_interval_t speed = 0;

    bool hasDegrees = false;
    float degrees = 0.0f;

    bool hasDelay = false;
    uint32_t delayMs = 0;

    // set_trigger_mode; false if "mode" was missing or not WIRED/IR
    bool hasTriggerMode = false;
    TriggerMode triggerMode = TriggerMode::WIRED;

    // debug_wired_shutter
    bool wiredState = false;
};

struct CommandDefaults {
    step_interval_t speed = 4;       // configured "normal" speed
    uint32_t delayMs = 1000;         // configured "medium" photo delay
    float degrees = 45.0f;
};

/**
 * Applies remote commands to the shared state
 *
 * Each command is installed under a single lock acquisition. Unknown
 * commands are ignored. The diagnostic commands go straight to the
 * shutter outputs and never touch the state.
 */
class CommandHandler {
public:
    CommandHandler(SharedState& shared, CameraTrigger& camera, const CommandDefaults& defaults)
        : shared_(shared), camera_(camera), defaults_(defaults) {}

    /**
     * @return true if the command was recognized and acted on
     */
    bool apply(const RemoteCommand& cmd);

private:
    step_interval_t speedOrDefault(const RemoteCommand& cmd) const {
        return cmd.hasSpeed ? cmd.speed : defaults_.speed;
    }

    SharedState& shared_;
    CameraTrigger& camera_;
    CommandDefaults defaults_;
};

#endif // TURNTABLE_COMMAND_HANDLER_H
