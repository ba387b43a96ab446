#ifndef TURNTABLE_BUTTON_INPUT_H
#define TURNTABLE_BUTTON_INPUT_H

#include <atomic>
#include <cstdint>
#include "types.h"

enum class ButtonPhase : uint8_t {
    IDLE,
    HELD,
    DEBOUNCING
};

enum class ButtonAction : uint8_t {
    NONE,
    CYCLE_SPEED,   // Short press released (< LONG_PRESS_MS)
    TOGGLE_SPIN    // Held past LONG_PRESS_MS (fires once per hold)
};

/**
 * Button press classifier - one action per physical press/release
 *
 * Pure logic, no GPIO dependency. Testable on host.
 *
 * Threading:
 * - onEdge() runs in the GPIO interrupt; it never blocks or locks
 * - poll() and takePendingAction() run in the motor task
 * Every field is a lock-free atomic. The pending action is a single
 * slot with last-write-wins semantics, so the ISR/task handoff needs
 * no mutex.
 *
 * Usage:
 *   // ISR (CHANGE):
 *   button.onEdge(digitalRead(pin) == HIGH, millis());
 *
 *   // Motor loop, once per iteration:
 *   button.poll(millis());
 *   ButtonAction action = button.takePendingAction();
 */
class ButtonInput {
public:
    static constexpr millis_t DEBOUNCE_MS = 250;
    static constexpr millis_t LONG_PRESS_MS = 500;

    /**
     * Feed one edge from the interrupt
     * @param level true = pressed (pin HIGH with pull-down)
     * @param now   millis() at the edge
     */
    void onEdge(bool level, millis_t now);

    /**
     * Advance timers: end debounce windows and detect long presses
     */
    void poll(millis_t now);

    /**
     * Read and clear the pending action
     * @return ButtonAction::NONE if nothing is pending
     */
    ButtonAction takePendingAction();

    ButtonPhase phase() const { return static_cast<ButtonPhase>(phase_.load()); }
    bool hasPendingAction() const { return pendingAction_.load() != static_cast<uint8_t>(ButtonAction::NONE); }

private:
    void setPhase(ButtonPhase phase) { phase_.store(static_cast<uint8_t>(phase)); }
    void dispatch(ButtonAction action, millis_t now);

    std::atomic<uint8_t> phase_{static_cast<uint8_t>(ButtonPhase::IDLE)};
    std::atomic<millis_t> pressStartedAt_{0};
    std::atomic<bool> longPressFired_{false};
    std::atomic<uint8_t> pendingAction_{static_cast<uint8_t>(ButtonAction::NONE)};
    std::atomic<millis_t> debounceDeadline_{0};
};

#endif // TURNTABLE_BUTTON_INPUT_H
