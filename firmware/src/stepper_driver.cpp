#include "stepper_driver.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

// Coil pattern per phase (IN1..IN4)
static const uint8_t FULL_STEP_SEQUENCE[4][4] = {
    {1, 1, 0, 0},
    {0, 1, 1, 0},
    {0, 0, 1, 1},
    {1, 0, 0, 1},
};

FullStepStepper::FullStepStepper(const uint8_t (&pins)[4]) {
    for (int i = 0; i < 4; i++) pins_[i] = pins[i];
}

void FullStepStepper::begin() {
    for (int i = 0; i < 4; i++) {
        pinMode(pins_[i], OUTPUT);
        digitalWrite(pins_[i], LOW);
    }
    lastStepAt_ = millis();
}

void FullStepStepper::setStepInterval(step_interval_t ms) {
    interval_ = ms > 0 ? ms : 1;
}

void FullStepStepper::step(int direction) {
    unsigned long elapsed = millis() - lastStepAt_;
    if (elapsed < interval_) {
        vTaskDelay(pdMS_TO_TICKS(interval_ - elapsed));
    }

    phase_ = (phase_ + (direction >= 0 ? 1 : 3)) & 0x03;
    writePhase(phase_);
    lastStepAt_ = millis();
}

// No holding torque; the platter can be turned by hand
void FullStepStepper::release() {
    for (int i = 0; i < 4; i++) {
        digitalWrite(pins_[i], LOW);
    }
}

void FullStepStepper::writePhase(uint8_t phase) {
    for (int i = 0; i < 4; i++) {
        digitalWrite(pins_[i], FULL_STEP_SEQUENCE[phase][i] ? HIGH : LOW);
    }
}
