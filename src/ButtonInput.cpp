#include "ButtonInput.h"

void ButtonInput::onEdge(bool level, millis_t now) {
    ButtonPhase current = phase();
    if (current == ButtonPhase::DEBOUNCING) return;

    if (level) {
        if (current != ButtonPhase::HELD) {
            pressStartedAt_.store(now);
            longPressFired_.store(false);
            setPhase(ButtonPhase::HELD);
        }
    } else if (current == ButtonPhase::HELD) {
        setPhase(ButtonPhase::IDLE);
        if (!longPressFired_.load()) {
            dispatch(ButtonAction::CYCLE_SPEED, now);
        }
    }
}

void ButtonInput::poll(millis_t now) {
    ButtonPhase current = phase();

    if (current == ButtonPhase::DEBOUNCING) {
        if (millisDiff(now, debounceDeadline_.load()) >= 0) {
            setPhase(ButtonPhase::IDLE);
        }
        return;
    }

    if (current == ButtonPhase::HELD && !longPressFired_.load()) {
        if (millisDiff(now, pressStartedAt_.load()) >= static_cast<int32_t>(LONG_PRESS_MS)) {
            longPressFired_.store(true);
            dispatch(ButtonAction::TOGGLE_SPIN, now);
        }
    }
}

ButtonAction ButtonInput::takePendingAction() {
    uint8_t raw = pendingAction_.exchange(static_cast<uint8_t>(ButtonAction::NONE));
    return static_cast<ButtonAction>(raw);
}

// Overwrites any unconsumed action and opens a fresh debounce window
void ButtonInput::dispatch(ButtonAction action, millis_t now) {
    pendingAction_.store(static_cast<uint8_t>(action));
    debounceDeadline_.store(now + DEBOUNCE_MS);
    setPhase(ButtonPhase::DEBOUNCING);
}
