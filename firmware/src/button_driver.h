#ifndef BUTTON_DRIVER_H
#define BUTTON_DRIVER_H

#include <stdint.h>
#include "freertos/FreeRTOS.h"
#include "ButtonInput.h"

/**
 * GPIO interrupt front end for the push button
 *
 * Every edge (both directions) is forwarded to the ButtonInput classifier
 * straight from the ISR; no queue, the classifier is lock-free.
 */
class ButtonDriver
{
public:
    ButtonDriver(uint8_t buttonPin, ButtonInput& input);
    bool start();

    static void IRAM_ATTR buttonEdge_ISR(void *arg);

private:
    const uint8_t _buttonPin;
    ButtonInput& _input;
};

#endif // BUTTON_DRIVER_H
