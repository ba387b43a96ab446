#ifndef HARDWARE_CONFIG_H
#define HARDWARE_CONFIG_H

#include <Arduino.h>
#include <cstdint>

namespace HardwareConfig {
    // Hardware pin assignments (Waveshare ESP32-S3-Zero)

    // ULN2003 board driving the 28BYJ-48, IN1..IN4 in coil order
    constexpr uint8_t STEPPER_PINS[4] = {4, 5, 6, 7};

    // Momentary push button to 3V3, internal pull-down (HIGH = pressed)
    constexpr uint8_t BUTTON_PIN = 1;

    // Opto-isolator on the camera remote jack (HIGH = shutter closed)
    constexpr uint8_t WIRED_SHUTTER_PIN = 10;

    // IR LED through a 2N2222, only populated on "with_ir" boards
    constexpr uint8_t IR_TX_PIN = 13;

    // Single-colour status LED: Wi-Fi state, then lit while the shutter fires
    constexpr uint8_t STATUS_LED_PIN = 17;

    constexpr uint32_t SERIAL_BAUD = 115200;
}

#endif // HARDWARE_CONFIG_H
