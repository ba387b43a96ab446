#include "motor_task.h"
#include "WatchdogHelper.h"
#include "esp_log.h"

static const char* TAG = "MOTOR";

bool MotorTask::start() {
    BaseType_t created = xTaskCreatePinnedToCore(taskFunction, "motor", STACK_SIZE, this, PRIORITY, &handle_, CORE);
    if (created != pdPASS) {
        ESP_LOGE(TAG, "Failed to create motor task");
        return false;
    }
    ESP_LOGI(TAG, "Started on Core %d", CORE);
    return true;
}

void MotorTask::taskFunction(void* params) {
    static_cast<MotorTask*>(params)->run();
}

void MotorTask::run() {
    if (!WatchdogHelper::subscribeCurrentTask()) {
        ESP_LOGW(TAG, "Task watchdog subscription failed");
    }

    while (true) {
        loop_.tick();
        WatchdogHelper::feed();

        uint32_t faults = loop_.faultCount();
        if (faults != reportedFaults_) {
            reportedFaults_ = faults;
            ESP_LOGE(TAG, "Fault #%u: %s", static_cast<unsigned>(faults), loop_.lastFault().c_str());
        }
    }
}
