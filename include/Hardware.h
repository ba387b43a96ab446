#ifndef TURNTABLE_HARDWARE_H
#define TURNTABLE_HARDWARE_H

#include "types.h"

/**
 * Hardware seams used by the control core
 *
 * The firmware implements these on top of GPIO, IRsend and FreeRTOS
 * (a semaphore mutex for TaskLock);
 * the host tests implement them with fakes.
 */

/**
 * Stepper motor driver
 *
 * step() paces itself: it returns no sooner than one step interval
 * after the previous step, so the caller can loop on it directly.
 */
class StepperDriver {
public:
    virtual ~StepperDriver() = default;

    /**
     * Advance one full step
     * @param direction STEP_FORWARD or STEP_BACKWARD
     */
    virtual void step(int direction) = 0;

    virtual void setStepInterval(step_interval_t ms) = 0;

    /**
     * De-energize all coils (platter free-wheels, no holding current)
     */
    virtual void release() = 0;
};

/**
 * Camera shutter outputs: wired release, IR LED, activity indicator
 */
class ShutterOutput {
public:
    virtual ~ShutterOutput() = default;

    virtual void setWired(bool active) = 0;
    virtual void setIndicator(bool on) = 0;

    /**
     * Transmit the IR shutter code once (blocking until sent)
     * @return false if no IR transmitter is fitted
     */
    virtual bool sendInfrared() = 0;
};

/**
 * Time source and suspension points for the calling task
 */
class TaskClock {
public:
    virtual ~TaskClock() = default;

    virtual millis_t nowMs() = 0;

    // Suspend the calling task
    virtual void sleepMs(millis_t ms) = 0;

    // Let other ready tasks run without a fixed delay
    virtual void yield() = 0;
};

/**
 * Mutual exclusion between tasks
 *
 * Held only for short critical sections; lock() blocks until acquired.
 */
class TaskLock {
public:
    virtual ~TaskLock() = default;

    virtual void lock() = 0;
    virtual void unlock() = 0;
};

// Holds a TaskLock for the lifetime of the scope
class TaskLockGuard {
public:
    explicit TaskLockGuard(TaskLock& lock) : lock_(lock) { lock_.lock(); }
    ~TaskLockGuard() { lock_.unlock(); }

    TaskLockGuard(const TaskLockGuard&) = delete;
    TaskLockGuard& operator=(const TaskLockGuard&) = delete;

private:
    TaskLock& lock_;
};

#endif // TURNTABLE_HARDWARE_H
