#ifndef RTOS_CLOCK_H
#define RTOS_CLOCK_H

#include <Arduino.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "Hardware.h"
#include "WatchdogHelper.h"

/**
 * TaskClock over millis() and vTaskDelay()
 *
 * With feedWatchdog set, sleeps longer than WATCHDOG_SLICE_MS are split
 * and the TWDT is fed between slices. Only use that on a subscribed task.
 */
class RtosClock : public TaskClock {
public:
    static constexpr millis_t WATCHDOG_SLICE_MS = 1000;

    explicit RtosClock(bool feedWatchdog) : feedWatchdog_(feedWatchdog) {}

    millis_t nowMs() override { return static_cast<millis_t>(millis()); }

    void sleepMs(millis_t ms) override {
        while (feedWatchdog_ && ms > WATCHDOG_SLICE_MS) {
            vTaskDelay(pdMS_TO_TICKS(WATCHDOG_SLICE_MS));
            WatchdogHelper::feed();
            ms -= WATCHDOG_SLICE_MS;
        }
        vTaskDelay(pdMS_TO_TICKS(ms));
    }

    void yield() override { vTaskDelay(0); }

private:
    const bool feedWatchdog_;
};

#endif
