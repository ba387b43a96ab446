#include "Arduino.h"
#include "button_driver.h"
#include "driver/gpio.h"
#include "esp_log.h"
#include "esp_timer.h"

static const char* TAG = "BUTTON";

ButtonDriver::ButtonDriver(uint8_t buttonPin, ButtonInput& input)
    : _buttonPin(buttonPin), _input(input)
{
}

void IRAM_ATTR ButtonDriver::buttonEdge_ISR(void *arg)
{
    ButtonDriver* self = static_cast<ButtonDriver*>(arg);
    bool pressed = gpio_get_level(static_cast<gpio_num_t>(self->_buttonPin)) != 0;

    // Same time base as millis(), which is not ISR safe on every core version
    millis_t now = static_cast<millis_t>(esp_timer_get_time() / 1000);
    self->_input.onEdge(pressed, now);
}

bool ButtonDriver::start()
{
    gpio_num_t pin = static_cast<gpio_num_t>(_buttonPin);

    gpio_config_t io_conf;
    io_conf.intr_type = GPIO_INTR_ANYEDGE;  // Press and release
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << _buttonPin);
    io_conf.pull_down_en = GPIO_PULLDOWN_ENABLE;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "gpio_config failed: %s", esp_err_to_name(err));
        return false;
    }

    // Already installed is fine (another driver may have done it)
    err = gpio_install_isr_service(0);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        ESP_LOGE(TAG, "ISR service install failed: %s", esp_err_to_name(err));
        return false;
    }

    err = gpio_isr_handler_add(pin, &ButtonDriver::buttonEdge_ISR, this);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "ISR handler add failed: %s", esp_err_to_name(err));
        return false;
    }

    ESP_LOGI(TAG, "Button on GPIO%u", _buttonPin);
    return true;
}
