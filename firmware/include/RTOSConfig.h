#ifndef RTOS_CONFIG_H_
#define RTOS_CONFIG_H_

#include "freertos/FreeRTOS.h"

namespace RTOS {

// Priorities
constexpr UBaseType_t NORMAL_PRIORITY = 3;
constexpr UBaseType_t HIGH_PRIORITY = 5;

// Stack sizes (network task holds ArduinoJson documents on its stack)
constexpr configSTACK_DEPTH_TYPE MEDIUM_STACK_SIZE = 1024*4;
constexpr configSTACK_DEPTH_TYPE LARGE_STACK_SIZE = 1024*8;

// Motor task gets core 1 to itself; Wi-Fi and the status server share core 0
constexpr BaseType_t MOTOR_CORE = 1;
constexpr BaseType_t NETWORK_CORE = 0;

} // namespace RTOS

#endif // RTOS_CONFIG_H_
