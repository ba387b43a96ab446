/**
 * Button Test - Press Classifier Bench Check
 *
 * Purpose: Verify button wiring and debounce/long-press timing before
 * running the full turntable firmware
 *
 * Hardware: push button from GPIO1 to 3V3 (internal pull-down)
 *
 * Behavior:
 * - Raw edges are fed to the same classifier the firmware uses
 * - Each classified press prints SHORT (cycle speed) or LONG (toggle spin)
 * - Built-in LED lights while the button reads as held
 */

#include <Arduino.h>
#include "ButtonInput.h"

#define BUTTON_PIN 1
#define LED_PIN 17

ButtonInput button;

volatile uint32_t edgeCount = 0;

void IRAM_ATTR buttonISR() {
    button.onEdge(digitalRead(BUTTON_PIN) == HIGH, millis());
    edgeCount++;
}

void setup() {
    Serial.begin(115200);
    delay(1000);

    pinMode(BUTTON_PIN, INPUT_PULLDOWN);
    pinMode(LED_PIN, OUTPUT);
    attachInterrupt(digitalPinToInterrupt(BUTTON_PIN), buttonISR, CHANGE);

    Serial.println("Button test ready");
    Serial.printf("Short press < %ums, long press >= %ums, debounce %ums\n",
                  ButtonInput::LONG_PRESS_MS, ButtonInput::LONG_PRESS_MS, ButtonInput::DEBOUNCE_MS);
}

void loop() {
    button.poll(millis());

    switch (button.takePendingAction()) {
        case ButtonAction::CYCLE_SPEED:
            Serial.printf("[%lu] SHORT press (edges so far: %u)\n", millis(), edgeCount);
            break;
        case ButtonAction::TOGGLE_SPIN:
            Serial.printf("[%lu] LONG press (edges so far: %u)\n", millis(), edgeCount);
            break;
        case ButtonAction::NONE:
            break;
    }

    digitalWrite(LED_PIN, button.phase() == ButtonPhase::HELD ? HIGH : LOW);
    delay(5);
}
