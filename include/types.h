#ifndef TURNTABLE_TYPES_H
#define TURNTABLE_TYPES_H

#include <cstdint>

// Timestamp in milliseconds (from millis()), wraps after ~49 days
typedef uint32_t millis_t;

// Milliseconds between successive motor steps (smaller = faster)
typedef uint32_t step_interval_t;

/**
 * Signed difference a - b between two millis() timestamps.
 * Stays correct across the 32-bit wraparound as long as the real
 * distance is under ~24 days.
 */
inline int32_t millisDiff(millis_t a, millis_t b) {
    return static_cast<int32_t>(a - b);
}

// 28BYJ-48 gearbox (1650688/25 per rev, full step) into the 810:6 platter ring
static constexpr double STEPS_PER_DEGREE = (1650688.0 * 6.0) / (360.0 * 810.0);

static constexpr int STEP_FORWARD = 1;
static constexpr int STEP_BACKWARD = -1;

#endif // TURNTABLE_TYPES_H
