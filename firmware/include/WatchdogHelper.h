#pragma once
#include "esp_task_wdt.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

/**
 * Task Watchdog Timer (TWDT) helper for the motor task.
 *
 * Problem: in SPIN at 1ms/step the motor task only ever blocks for a
 * single tick, so IDLE1 barely runs and its TWDT subscription is a poor
 * signal of health. A photo sequence, on the other hand, can park the
 * task for seconds inside a trigger delay.
 *
 * Solution: unsubscribe IDLE1 and subscribe the motor task instead. The
 * task feeds the watchdog every loop iteration, and long sleeps are cut
 * into slices that feed between them (see RtosClock).
 */
namespace WatchdogHelper {

/**
 * Unsubscribe the IDLE task for a specific core from TWDT.
 * Call from setup() after the motor task starts.
 *
 * @param core The core whose IDLE task should be unsubscribed (0 or 1)
 */
inline void unsubscribeIdleTask(BaseType_t core) {
    TaskHandle_t idle = xTaskGetIdleTaskHandleForCPU(core);
    if (idle) {
        esp_task_wdt_delete(idle);
    }
}

/**
 * Subscribe the current task to TWDT.
 * Call from task function before entering main loop.
 *
 * @return false if the watchdog refused the subscription
 */
inline bool subscribeCurrentTask() {
    return esp_task_wdt_add(NULL) == ESP_OK;
}

/**
 * Feed the watchdog timer to prevent timeout.
 * Only valid from a subscribed task.
 */
inline void feed() {
    esp_task_wdt_reset();
}

}  // namespace WatchdogHelper
