#ifndef RTOS_MUTEX_H
#define RTOS_MUTEX_H

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "Hardware.h"

/**
 * TaskLock over a FreeRTOS mutex semaphore
 *
 * Priority inheritance comes with the mutex type. Never lock from an ISR.
 */
class RtosMutex : public TaskLock {
public:
    RtosMutex() : handle_(xSemaphoreCreateMutex()) {}
    ~RtosMutex() override {
        if (handle_) vSemaphoreDelete(handle_);
    }

    RtosMutex(const RtosMutex&) = delete;
    RtosMutex& operator=(const RtosMutex&) = delete;

    // false if the semaphore could not be allocated
    bool valid() const { return handle_ != nullptr; }

    void lock() override { xSemaphoreTake(handle_, portMAX_DELAY); }
    void unlock() override { xSemaphoreGive(handle_); }

private:
    SemaphoreHandle_t handle_;
};

#endif
