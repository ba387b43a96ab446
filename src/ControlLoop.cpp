#include "ControlLoop.h"
#include <cmath>
#include <cstdio>
#include <exception>

namespace {

constexpr int PULSE_STEPS = 25;
constexpr step_interval_t PULSE_STEP_INTERVAL_MS = 2;
constexpr millis_t PULSE_GAP_MS = 50;

bool sequenceStillCurrent(const OperationState& state, uint32_t epoch) {
    return state.mode == OperationMode::SEQUENCE && state.epoch == epoch;
}

std::string sequenceStatus(const SequenceProgress& progress, const char* activity) {
    char buf[64];
    snprintf(buf, sizeof(buf), "Sequence %u/%u: %s",
             static_cast<unsigned>(progress.currentStep + 1),
             static_cast<unsigned>(progress.totalSteps),
             activity);
    return buf;
}

} // anonymous namespace

// Smaller angles are raised to one motor step, larger ones capped at a full turn
static double planDegrees(float degrees) {
    if (!(degrees > 0.0f)) return 360.0 / ControlLoop::FALLBACK_SEQUENCE_STEPS;
    if (degrees < ControlLoop::MIN_SEQUENCE_DEGREES) return ControlLoop::MIN_SEQUENCE_DEGREES;
    if (degrees > 360.0f) return 360.0;
    return degrees;
}

uint32_t ControlLoop::sequenceTotalSteps(float degrees) {
    double steps = std::floor(360.0 / planDegrees(degrees));
    return steps < 1.0 ? 1 : static_cast<uint32_t>(steps);
}

uint32_t ControlLoop::sequenceStepsPerRotation(float degrees) {
    return static_cast<uint32_t>(std::lround(planDegrees(degrees) * STEPS_PER_DEGREE));
}

void ControlLoop::tick() {
    try {
        iterate();
        return;
    } catch (const std::exception& e) {
        recordFault(e.what());
    } catch (...) {
        recordFault("unknown error");
    }

    // Second chance to tell listeners; a failure here is only counted
    try {
        broadcaster_.broadcast();
    } catch (const std::exception& e) {
        faultCount_++;
        lastFault_ = e.what();
    } catch (...) {
        faultCount_++;
        lastFault_ = "unknown error";
    }
}

void ControlLoop::iterate() {
    serviceButton();

    OperationMode mode;
    uint32_t epoch;
    step_interval_t speed;
    TriggerMode trigger;
    SequencePhase phase;
    {
        SharedState::Access access = shared_.lock();
        const OperationState& state = access.state();
        mode = state.mode;
        epoch = state.epoch;
        speed = state.effectiveSpeed(access.speeds());
        trigger = state.triggerMode;
        phase = state.subState;
    }

    if (!hasLastMode_ || mode != lastMode_ || epoch != lastEpoch_) {
        motor_.release();
        appliedSpeed_ = 0;
        hasLastMode_ = true;
        lastMode_ = mode;
        lastEpoch_ = epoch;
    }

    switch (mode) {
        case OperationMode::IDLE:
            runIdle();
            break;
        case OperationMode::SPIN:
            runSpin(speed);
            break;
        case OperationMode::PICTURE:
            runPicture(trigger, epoch);
            break;
        case OperationMode::SEQUENCE:
            runSequence(phase, epoch);
            break;
    }

    broadcaster_.heartbeat(mode);
}

void ControlLoop::serviceButton() {
    button_.poll(clock_.nowMs());
    ButtonAction action = button_.takePendingAction();
    if (action == ButtonAction::NONE) return;

    {
        SharedState::Access access = shared_.lock();
        OperationState& state = access.state();
        SpeedTable& speeds = access.speeds();

        if (action == ButtonAction::CYCLE_SPEED) {
            speeds.cycle();
            if (state.mode == OperationMode::SPIN) {
                state.params.hasSpeed = true;
                state.params.speed = speeds.current();
            }
        } else if (action == ButtonAction::TOGGLE_SPIN) {
            if (state.mode == OperationMode::SPIN) {
                state.install(OperationMode::IDLE);
            } else {
                OperationParams params = state.params;
                params.hasSpeed = true;
                params.speed = speeds.current();
                state.install(OperationMode::SPIN, params);
            }
        }
    }

    broadcaster_.broadcast();
}

void ControlLoop::runIdle() {
    publishStatus("Ready");
    motor_.release();
    clock_.sleepMs(IDLE_SLEEP_MS);
}

void ControlLoop::runSpin(step_interval_t speed) {
    if (appliedSpeed_ != speed) {
        appliedSpeed_ = speed;
        motor_.setStepInterval(speed);

        char buf[48];
        snprintf(buf, sizeof(buf), "Spinning (speed: %ums/step)", static_cast<unsigned>(speed));
        publishStatus(buf);
    }

    motor_.step(STEP_FORWARD);
    clock_.yield();
}

void ControlLoop::runPicture(TriggerMode trigger, uint32_t epoch) {
    publishStatus("Taking picture...");

    if (!camera_.fire(trigger)) {
        recordFault("camera trigger failed");
        broadcaster_.broadcast();
        return;
    }

    // Any command applied while the shutter was busy is the later write
    bool completed = false;
    {
        SharedState::Access access = shared_.lock();
        OperationState& state = access.state();
        if (state.mode == OperationMode::PICTURE && state.epoch == epoch) {
            state.returnToIdle("Picture complete. Ready.");
            completed = true;
        }
    }
    if (completed) broadcaster_.broadcast();
}

void ControlLoop::runSequence(SequencePhase phase, uint32_t epoch) {
    if (phase == SequencePhase::DONE) {
        if (!enterSequence(epoch)) return;
        phase = SequencePhase::TRIGGER;
    }

    if (phase == SequencePhase::TRIGGER) {
        runTrigger(epoch);
    } else if (phase == SequencePhase::ROTATE) {
        runRotate(epoch);
    }
}

bool ControlLoop::enterSequence(uint32_t epoch) {
    float degrees;
    step_interval_t speed;
    {
        SharedState::Access access = shared_.lock();
        degrees = access.state().params.degreesPerStep;
        speed = access.state().effectiveSpeed(access.speeds());
    }

    motor_.setStepInterval(speed);
    appliedSpeed_ = speed;

    SequenceProgress plan;
    plan.currentStep = 0;
    plan.totalSteps = sequenceTotalSteps(degrees);
    plan.stepsPerRotation = sequenceStepsPerRotation(degrees);
    plan.stepsRemainingThisRotation = plan.stepsPerRotation;

    SharedState::Access access = shared_.lock();
    OperationState& state = access.state();
    if (!sequenceStillCurrent(state, epoch)) return false;
    state.progress = plan;
    state.subState = SequencePhase::TRIGGER;
    return true;
}

void ControlLoop::runTrigger(uint32_t epoch) {
    SequenceProgress progress;
    TriggerMode trigger;
    uint32_t delayMs;
    {
        SharedState::Access access = shared_.lock();
        progress = access.state().progress;
        trigger = access.state().triggerMode;
        delayMs = access.state().params.delayMs;
    }

    publishStatus(sequenceStatus(progress, "Processing..."));

    if (!camera_.fire(trigger)) {
        recordFault("camera trigger failed");
        broadcaster_.broadcast();
        return;
    }
    clock_.sleepMs(delayMs);

    bool finished = false;
    {
        SharedState::Access access = shared_.lock();
        OperationState& state = access.state();
        if (!sequenceStillCurrent(state, epoch)) return;

        if (progress.currentStep + 1 >= progress.totalSteps) {
            state.returnToIdle("Sequence complete. Ready.");
            finished = true;
        } else {
            state.subState = SequencePhase::ROTATE;
        }
    }
    if (finished) broadcaster_.broadcast();
}

void ControlLoop::runRotate(uint32_t epoch) {
    SequenceProgress progress;
    {
        SharedState::Access access = shared_.lock();
        progress = access.state().progress;
    }

    publishStatus(sequenceStatus(progress, "Rotating..."));

    for (uint32_t i = 0; i < progress.stepsRemainingThisRotation; i++) {
        {
            SharedState::Access access = shared_.lock();
            OperationState& state = access.state();
            if (!sequenceStillCurrent(state, epoch)) return;  // stopped mid-rotation
            state.progress.stepsRemainingThisRotation--;
        }
        motor_.step(STEP_FORWARD);
        clock_.yield();
    }

    SharedState::Access access = shared_.lock();
    OperationState& state = access.state();
    if (!sequenceStillCurrent(state, epoch)) return;
    state.progress.currentStep++;
    state.progress.stepsRemainingThisRotation = state.progress.stepsPerRotation;
    state.subState = SequencePhase::TRIGGER;
}

void ControlLoop::publishStatus(const std::string& status) {
    {
        SharedState::Access access = shared_.lock();
        if (access.state().message == status) return;
        access.state().message = status;
    }
    broadcaster_.broadcast();
}

void ControlLoop::recordFault(const std::string& reason) {
    faultCount_++;
    lastFault_ = reason;

    SharedState::Access access = shared_.lock();
    access.state().returnToIdle("Error: " + reason);
}

void hapticPulse(StepperDriver& motor, TaskClock& clock, int repetitions) {
    motor.setStepInterval(PULSE_STEP_INTERVAL_MS);
    for (int rep = 0; rep < repetitions; rep++) {
        for (int i = 0; i < PULSE_STEPS; i++) motor.step(STEP_FORWARD);
        for (int i = 0; i < PULSE_STEPS; i++) motor.step(STEP_BACKWARD);
        clock.sleepMs(PULSE_GAP_MS);
    }
    motor.release();
}
