#include <Arduino.h>
#include "ButtonInput.h"
#include "CameraTrigger.h"
#include "CommandHandler.h"
#include "ControlLoop.h"
#include "MessageCodec.h"
#include "OperationState.h"
#include "StatusBroadcaster.h"
#include "TurntableConfig.h"
#include "WatchdogHelper.h"
#include "button_driver.h"
#include "hardware_config.h"
#include "motor_task.h"
#include "network_link.h"
#include "rtos_clock.h"
#include "rtos_mutex.h"
#include "serial_command.h"
#include "settings_store.h"
#include "shutter_output.h"
#include "status_server.h"

static const int STARTUP_PULSES = 2;

// Runtime settings, loaded once in setup()
static TurntableConfig g_config;

static FullStepStepper stepper(HardwareConfig::STEPPER_PINS);
static ButtonInput buttonInput;
static ButtonDriver buttonDriver(HardwareConfig::BUTTON_PIN, buttonInput);
static RtosMutex stateMutex;
static RtosMutex clientMutex;
static ClientRegistry clientRegistry(clientMutex);

// Motor task clock feeds the watchdog through long sleeps; the boot clock
// runs on the Arduino loop task, which is not subscribed
static RtosClock motorClock(true);
static RtosClock bootClock(false);

static void haltWithError(const char* what) {
    Serial.printf("ERROR: %s\n", what);
    while (1) { delay(1000); }
}

void setup() {
    Serial.begin(HardwareConfig::SERIAL_BAUD);
    delay(2000);
    Serial.println("Smart Turntable Initializing...");

    if (!stateMutex.valid() || !clientMutex.valid()) {
        haltWithError("Failed to create state mutexes");
    }

    g_config = settingsLoad();
    Serial.printf("Host '%s', hardware %s\n", g_config.hostname.c_str(),
                  g_config.infraredFitted ? "with_ir" : "wired_only");

    // Everything below lives for the life of the firmware
    static GpioShutterOutput shutter(HardwareConfig::WIRED_SHUTTER_PIN, HardwareConfig::IR_TX_PIN,
                                     HardwareConfig::STATUS_LED_PIN, g_config.infraredFitted);
    static SharedState shared(stateMutex, g_config.speedTable(), g_config.autospin, g_config.triggerMode);
    static CameraTrigger camera(shutter, motorClock);
    static StatusBroadcaster broadcaster(shared, clientRegistry, motorClock, encodeStatus);
    static CommandHandler handler(shared, camera, g_config.commandDefaults());
    static ControlLoop controlLoop(shared, buttonInput, stepper, camera, motorClock, broadcaster);
    static MotorTask motorTask(controlLoop);
    static StatusServer statusServer(clientRegistry, handler, broadcaster);

    shutter.begin();
    stepper.begin();

    // Let the user feel that the board is alive
    hapticPulse(stepper, bootClock, STARTUP_PULSES);

    networkBegin(g_config);

    if (!buttonDriver.start()) {
        Serial.println("ERROR: Button unavailable, remote control only");
    }
    if (!motorTask.start()) {
        haltWithError("Failed to create motor task");
    }
    WatchdogHelper::unsubscribeIdleTask(RTOS::MOTOR_CORE);

    if (!statusServer.start()) {
        haltWithError("Failed to create server task");
    }

    serialCommandInit(shared, handler, broadcaster, g_config);

    Serial.printf("Startup mode %s, trigger %s\n",
                  g_config.autospin ? "SPIN" : "IDLE", triggerModeName(g_config.triggerMode));
    Serial.println("\n=== Smart Turntable Ready ===");
}

void loop() {
    serialCommandPoll();
    delay(10);
}
