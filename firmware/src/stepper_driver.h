#ifndef STEPPER_DRIVER_H
#define STEPPER_DRIVER_H

#include <Arduino.h>
#include "Hardware.h"

/**
 * Full-step (two coils on) driver for a 28BYJ-48 on a ULN2003 board
 *
 * step() sleeps the calling task until one interval has passed since the
 * previous step, then energizes the next coil pair.
 */
class FullStepStepper : public StepperDriver {
public:
    explicit FullStepStepper(const uint8_t (&pins)[4]);

    void begin();

    void step(int direction) override;
    void setStepInterval(step_interval_t ms) override;
    void release() override;

private:
    void writePhase(uint8_t phase);

    uint8_t pins_[4];
    uint8_t phase_ = 0;
    step_interval_t interval_ = 4;
    unsigned long lastStepAt_ = 0;
};

#endif
