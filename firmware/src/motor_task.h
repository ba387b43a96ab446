#pragma once
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "ControlLoop.h"
#include "RTOSConfig.h"

/**
 * Runs the ControlLoop forever on its own core
 *
 * The only task that touches the stepper. Subscribed to the task watchdog
 * and feeds it once per iteration.
 */
class MotorTask {
public:
    explicit MotorTask(ControlLoop& loop) : loop_(loop) {}

    bool start();

private:
    static void taskFunction(void* params);
    void run();

    ControlLoop& loop_;
    TaskHandle_t handle_ = nullptr;
    uint32_t reportedFaults_ = 0;

    static constexpr UBaseType_t PRIORITY = RTOS::HIGH_PRIORITY;
    static constexpr uint32_t STACK_SIZE = RTOS::MEDIUM_STACK_SIZE;
    static constexpr BaseType_t CORE = RTOS::MOTOR_CORE;
};
