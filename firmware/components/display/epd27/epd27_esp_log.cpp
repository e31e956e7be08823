/**
 * @file epd27_esp_log.cpp
 * @brief ESP_LOGx forwarding.
 */

#include "epd27_esp_log.h"
#include <esp_log.h>


void Epd27EspLogSink::write(Epd27LogLevel level, const char* tag, const char* message) {
    switch (level) {
        case EPD27_LOG_ERROR:
            ESP_LOGE(tag, "%s", message);
            break;
        case EPD27_LOG_WARN:
            ESP_LOGW(tag, "%s", message);
            break;
        case EPD27_LOG_INFO:
            ESP_LOGI(tag, "%s", message);
            break;
        case EPD27_LOG_DEBUG:
            ESP_LOGD(tag, "%s", message);
            break;
    }
}
