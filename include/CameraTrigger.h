#ifndef TURNTABLE_CAMERA_TRIGGER_H
#define TURNTABLE_CAMERA_TRIGGER_H

#include "Hardware.h"
#include "OperationState.h"

/**
 * Releases the camera shutter over the wired contact or the IR LED
 *
 * fire() is synchronous and suspends the calling task for the pulse
 * and settle time (~250ms). Call it without holding the state lock.
 */
class CameraTrigger {
public:
    static constexpr millis_t WIRED_PULSE_MS = 200;
    static constexpr millis_t SETTLE_MS = 50;

    CameraTrigger(ShutterOutput& output, TaskClock& clock)
        : output_(output), clock_(clock) {}

    /**
     * Fire once using the given transport, indicator lit throughout
     * @return false if the transport is unavailable (IR not fitted)
     */
    bool fire(TriggerMode mode);

    // Bench diagnostics - bypass the indicator and timing
    bool sendInfraredDirect() { return output_.sendInfrared(); }
    void setWiredDirect(bool active) { output_.setWired(active); }

private:
    ShutterOutput& output_;
    TaskClock& clock_;
};

#endif // TURNTABLE_CAMERA_TRIGGER_H
