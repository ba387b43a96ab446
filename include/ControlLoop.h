#ifndef TURNTABLE_CONTROL_LOOP_H
#define TURNTABLE_CONTROL_LOOP_H

#include <atomic>
#include <cstdint>
#include <string>
#include "ButtonInput.h"
#include "CameraTrigger.h"
#include "Hardware.h"
#include "OperationState.h"
#include "StatusBroadcaster.h"

/**
 * Operation state machine - the only code that actuates the motor
 *
 * One tick() = one loop iteration:
 *   1. Poll the button and apply its pending action (under the lock)
 *   2. Snapshot mode/epoch; on any change release the motor and drop caches
 *   3. Run the mode:
 *        IDLE     - release coils, "Ready", sleep IDLE_SLEEP_MS
 *        SPIN     - one step at params.speed, yield
 *        PICTURE  - trigger camera, return to IDLE
 *        SEQUENCE - DONE -> TRIGGER -> ROTATE -> TRIGGER ... -> IDLE
 *   4. Heartbeat broadcast while IDLE
 *
 * Errors never escape tick(): they become an "Error: ..." status and
 * force IDLE. Stop requests are observed between every ROTATE step.
 */
class ControlLoop {
public:
    static constexpr millis_t IDLE_SLEEP_MS = 100;

    // Photo count used when a sequence asks for <= 0 degrees
    static constexpr uint32_t FALLBACK_SEQUENCE_STEPS = 4;

    // One motor step; a sequence never rotates by less
    static constexpr double MIN_SEQUENCE_DEGREES = 1.0 / STEPS_PER_DEGREE;

    ControlLoop(SharedState& shared, ButtonInput& button, StepperDriver& motor,
                CameraTrigger& camera, TaskClock& clock, StatusBroadcaster& broadcaster)
        : shared_(shared)
        , button_(button)
        , motor_(motor)
        , camera_(camera)
        , clock_(clock)
        , broadcaster_(broadcaster)
    {
    }

    void tick();

    uint32_t faultCount() const { return faultCount_.load(); }

    // Only valid on the task that calls tick()
    const std::string& lastFault() const { return lastFault_; }

    // Photos per sequence: floor(360 / degrees), at least 1
    // degrees is first clamped to [MIN_SEQUENCE_DEGREES, 360]
    static uint32_t sequenceTotalSteps(float degrees);

    // Motor steps between photos: round(degrees * STEPS_PER_DEGREE)
    static uint32_t sequenceStepsPerRotation(float degrees);

private:
    void iterate();
    void serviceButton();

    void runIdle();
    void runSpin(step_interval_t speed);
    void runPicture(TriggerMode trigger, uint32_t epoch);
    void runSequence(SequencePhase phase, uint32_t epoch);
    bool enterSequence(uint32_t epoch);
    void runTrigger(uint32_t epoch);
    void runRotate(uint32_t epoch);

    // Set the status text; broadcasts only if it changed
    void publishStatus(const std::string& status);
    void recordFault(const std::string& reason);

    SharedState& shared_;
    ButtonInput& button_;
    StepperDriver& motor_;
    CameraTrigger& camera_;
    TaskClock& clock_;
    StatusBroadcaster& broadcaster_;

    bool hasLastMode_ = false;
    OperationMode lastMode_ = OperationMode::IDLE;
    uint32_t lastEpoch_ = 0;
    step_interval_t appliedSpeed_ = 0;  // 0 = nothing applied since last mode change

    std::atomic<uint32_t> faultCount_{0};
    std::string lastFault_;
};

/**
 * Short forward/back wiggle so the user feels the board come up
 * Leaves the coils released.
 */
void hapticPulse(StepperDriver& motor, TaskClock& clock, int repetitions);

#endif // TURNTABLE_CONTROL_LOOP_H
