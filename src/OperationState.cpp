#include "OperationState.h"
#include <cstring>

const char* operationModeName(OperationMode mode) {
    switch (mode) {
        case OperationMode::IDLE:     return "IDLE";
        case OperationMode::SPIN:     return "SPIN";
        case OperationMode::PICTURE:  return "PICTURE";
        case OperationMode::SEQUENCE: return "SEQUENCE";
        default:                      return "UNKNOWN";
    }
}

const char* triggerModeName(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::WIRED: return "WIRED";
        case TriggerMode::IR:    return "IR";
        default:                 return "UNKNOWN";
    }
}

bool parseTriggerMode(const char* name, TriggerMode& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "WIRED") == 0) {
        out = TriggerMode::WIRED;
        return true;
    }
    if (strcmp(name, "IR") == 0) {
        out = TriggerMode::IR;
        return true;
    }
    return false;
}

void OperationState::install(OperationMode newMode) {
    mode = newMode;
    resetSequence();
    epoch++;
}

void OperationState::install(OperationMode newMode, const OperationParams& newParams) {
    params = newParams;
    install(newMode);
}

void OperationState::returnToIdle(const std::string& status) {
    mode = OperationMode::IDLE;
    resetSequence();
    message = status;
}

void OperationState::resetSequence() {
    subState = SequencePhase::DONE;
    progress = SequenceProgress();
}

step_interval_t OperationState::effectiveSpeed(const SpeedTable& speeds) const {
    return params.hasSpeed ? params.speed : speeds.current();
}

SharedState::SharedState(TaskLock& lock, const SpeedTable& speeds, bool autospin, TriggerMode triggerMode)
    : lock_(lock)
    , speeds_(speeds)
{
    state_.triggerMode = triggerMode;
    if (autospin) {
        state_.mode = OperationMode::SPIN;
        state_.params.hasSpeed = true;
        state_.params.speed = speeds_.current();
    }
}

OperationState SharedState::copyState() {
    Access access = lock();
    return access.state();
}

SpeedTable SharedState::copySpeeds() {
    Access access = lock();
    return access.speeds();
}
