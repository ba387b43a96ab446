#ifndef SHUTTER_OUTPUT_H
#define SHUTTER_OUTPUT_H

#include <Arduino.h>
#include <IRsend.h>
#include "Hardware.h"

/**
 * Wired release, IR LED and status LED on GPIO
 */
class GpioShutterOutput : public ShutterOutput {
public:
    GpioShutterOutput(uint8_t wiredPin, uint8_t irPin, uint8_t ledPin, bool infraredFitted);

    void begin();

    void setWired(bool active) override;
    void setIndicator(bool on) override;
    bool sendInfrared() override;

private:
    const uint8_t wiredPin_;
    const uint8_t ledPin_;
    const bool infraredFitted_;
    IRsend irsend_;
};

#endif
