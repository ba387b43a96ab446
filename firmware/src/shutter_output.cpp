#include "shutter_output.h"

// Shutter release code as raw mark/space durations in microseconds
static const uint16_t IR_SHUTTER_CODE[] = {550, 7200, 550, 40000};
static const uint16_t IR_SHUTTER_CODE_LEN = sizeof(IR_SHUTTER_CODE) / sizeof(IR_SHUTTER_CODE[0]);
static const uint16_t IR_CARRIER_HZ = 32700;

GpioShutterOutput::GpioShutterOutput(uint8_t wiredPin, uint8_t irPin, uint8_t ledPin, bool infraredFitted)
    : wiredPin_(wiredPin)
    , ledPin_(ledPin)
    , infraredFitted_(infraredFitted)
    , irsend_(irPin)
{
}

void GpioShutterOutput::begin() {
    pinMode(wiredPin_, OUTPUT);
    digitalWrite(wiredPin_, LOW);
    pinMode(ledPin_, OUTPUT);
    digitalWrite(ledPin_, LOW);

    if (infraredFitted_) {
        irsend_.begin();
        Serial.println("[SHUTTER] IR transmitter enabled");
    } else {
        Serial.println("[SHUTTER] Wired only board, IR disabled");
    }
}

void GpioShutterOutput::setWired(bool active) {
    digitalWrite(wiredPin_, active ? HIGH : LOW);
}

void GpioShutterOutput::setIndicator(bool on) {
    digitalWrite(ledPin_, on ? HIGH : LOW);
}

bool GpioShutterOutput::sendInfrared() {
    if (!infraredFitted_) {
        return false;
    }
    irsend_.sendRaw(IR_SHUTTER_CODE, IR_SHUTTER_CODE_LEN, IR_CARRIER_HZ);
    return true;
}
