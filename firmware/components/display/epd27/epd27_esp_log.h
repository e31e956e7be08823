/**
 * @file epd27_esp_log.h
 * @brief Epd27LogSink that forwards to the ESP-IDF logging library.
 */

#pragma once

#include "epd27_log.h"


class Epd27EspLogSink : public Epd27LogSink {

public:

    void write(Epd27LogLevel level, const char* tag, const char* message) override;
};
