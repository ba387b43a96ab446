/**
 * Shutter Test - Camera Release Exerciser
 *
 * Purpose: Confirm the camera fires over the wired jack and the IR LED
 * without the motor connected
 *
 * Hardware:
 * - Opto-isolator on GPIO10 to the camera remote jack
 * - IR LED (via transistor) on GPIO13
 * - Status LED on GPIO17
 *
 * Serial commands:
 *   w - wired pulse (200ms)
 *   i - IR shutter code
 *   a - alternate wired/IR every 3 seconds until another key
 */

#include <Arduino.h>
#include <IRsend.h>

#define WIRED_PIN 10
#define IR_PIN 13
#define LED_PIN 17

#define WIRED_PULSE_MS 200
#define AUTO_INTERVAL_MS 3000

// Mark/space in microseconds on a 32.7kHz carrier
const uint16_t SHUTTER_CODE[] = {550, 7200, 550, 40000};

IRsend irsend(IR_PIN);

bool autoMode = false;
bool nextIsIr = false;
unsigned long lastAutoFire = 0;

void fireWired() {
    digitalWrite(LED_PIN, HIGH);
    digitalWrite(WIRED_PIN, HIGH);
    delay(WIRED_PULSE_MS);
    digitalWrite(WIRED_PIN, LOW);
    digitalWrite(LED_PIN, LOW);
    Serial.println("Wired pulse sent");
}

void fireIr() {
    digitalWrite(LED_PIN, HIGH);
    irsend.sendRaw(SHUTTER_CODE, 4, 32700);
    digitalWrite(LED_PIN, LOW);
    Serial.println("IR code sent");
}

void setup() {
    Serial.begin(115200);
    delay(1000);

    pinMode(WIRED_PIN, OUTPUT);
    digitalWrite(WIRED_PIN, LOW);
    pinMode(LED_PIN, OUTPUT);
    irsend.begin();

    Serial.println("Shutter test ready: w=wired, i=IR, a=auto");
}

void loop() {
    if (Serial.available()) {
        char c = Serial.read();
        if (c == '\n' || c == '\r') return;
        autoMode = false;
        if (c == 'w') fireWired();
        else if (c == 'i') fireIr();
        else if (c == 'a') {
            autoMode = true;
            Serial.println("Auto mode (any key stops)");
        }
    }

    if (autoMode && millis() - lastAutoFire >= AUTO_INTERVAL_MS) {
        lastAutoFire = millis();
        if (nextIsIr) fireIr(); else fireWired();
        nextIsIr = !nextIsIr;
    }
}
