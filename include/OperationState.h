#ifndef TURNTABLE_OPERATION_STATE_H
#define TURNTABLE_OPERATION_STATE_H

#include <cstdint>
#include <string>
#include "Hardware.h"
#include "SpeedTable.h"
#include "types.h"

enum class OperationMode : uint8_t {
    IDLE,
    SPIN,
    PICTURE,
    SEQUENCE
};

// Photo sequence sub-state, meaningful only while mode == SEQUENCE
enum class SequencePhase : uint8_t {
    DONE,     // Not started (or finished) - next iteration computes the plan
    TRIGGER,
    ROTATE
};

enum class TriggerMode : uint8_t {
    WIRED,
    IR
};

const char* operationModeName(OperationMode mode);
const char* triggerModeName(TriggerMode mode);

/**
 * Parse "WIRED" / "IR"
 * @return false (out untouched) for anything else
 */
bool parseTriggerMode(const char* name, TriggerMode& out);

struct OperationParams {
    bool hasSpeed = false;
    step_interval_t speed = 0;
    float degreesPerStep = 45.0f;
    uint32_t delayMs = 0;
};

struct SequenceProgress {
    uint32_t currentStep = 0;
    uint32_t totalSteps = 0;
    uint32_t stepsPerRotation = 0;
    uint32_t stepsRemainingThisRotation = 0;
};

/**
 * What the turntable is doing - the single authoritative record
 *
 * Only ever touched through SharedState::Access.
 */
struct OperationState {
    OperationMode mode = OperationMode::IDLE;
    OperationParams params;
    SequencePhase subState = SequencePhase::DONE;
    SequenceProgress progress;
    TriggerMode triggerMode = TriggerMode::WIRED;
    std::string message = "Ready";

    // Bumped every time a command or button installs a mode
    uint32_t epoch = 0;

    /**
     * Install a mode from a command or button action
     * Discards any sequence progress, even when re-entering SEQUENCE.
     */
    void install(OperationMode newMode);
    void install(OperationMode newMode, const OperationParams& newParams);

    /**
     * Control-loop driven return to IDLE (picture done, sequence done, fault)
     * Does not bump epoch.
     */
    void returnToIdle(const std::string& status);

    void resetSequence();

    // Speed shown to listeners: params.speed, else the table's current entry
    step_interval_t effectiveSpeed(const SpeedTable& speeds) const;
};

/**
 * Lock-guarded owner of the OperationState and the speed table
 *
 * Created once at startup and passed by reference to the control loop,
 * command handler and status broadcaster. Critical sections must stay
 * short: never sleep, step the motor or do I/O while holding Access.
 *
 * Usage:
 *   {
 *       SharedState::Access access = shared.lock();
 *       access.state().install(OperationMode::IDLE);
 *   }   // unlocked here
 */
class SharedState {
public:
    class Access {
    public:
        Access(TaskLock& lock, OperationState& state, SpeedTable& speeds)
            : guard_(lock), state_(state), speeds_(speeds) {}

        OperationState& state() { return state_; }
        SpeedTable& speeds() { return speeds_; }

    private:
        TaskLockGuard guard_;
        OperationState& state_;
        SpeedTable& speeds_;
    };

    /**
     * @param lock Guards state and speeds; shared by every task that calls lock()
     * @param speeds Speed table (index is the initial selection)
     * @param autospin Start in SPIN at the table's current speed instead of IDLE
     * @param triggerMode Initial camera transport
     */
    SharedState(TaskLock& lock, const SpeedTable& speeds, bool autospin, TriggerMode triggerMode);

    Access lock() { return Access(lock_, state_, speeds_); }

    // Consistent copy for display/tests
    OperationState copyState();
    SpeedTable copySpeeds();

private:
    TaskLock& lock_;
    OperationState state_;
    SpeedTable speeds_;
};

#endif // TURNTABLE_OPERATION_STATE_H
