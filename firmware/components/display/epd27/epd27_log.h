/**
 * @file epd27_log.h
 * @brief Injected log sink for the e-paper engine.
 *
 * @details
 * The engine never calls ESP_LOGx directly. It writes through an
 * Epd27LogSink supplied by the application:
 *
 *     - On the ESP32, Epd27EspLogSink forwards to ESP_LOGE/W/I/D.
 *     - In host tests, a recording sink captures the lines.
 *     - With no sink (nullptr), nothing is logged.
 *
 * The code paths are the same in all three cases.
 */

#pragma once

#include <stdarg.h>
#include <stdint.h>


/**
 * @brief Log levels, in decreasing severity.
 */
enum Epd27LogLevel : uint8_t {
    EPD27_LOG_ERROR = 0,
    EPD27_LOG_WARN,
    EPD27_LOG_INFO,
    EPD27_LOG_DEBUG,
};


/**
 * @brief Destination for formatted log lines.
 */
class Epd27LogSink {

public:

    virtual ~Epd27LogSink() {}

    /**
     * @brief Write one formatted line.
     *
     * @param level Severity.
     * @param tag Component tag ("EPD27", "EPD27_BUS", ...).
     * @param message Formatted message, no trailing newline.
     */
    virtual void write(Epd27LogLevel level, const char* tag, const char* message) = 0;
};


/**
 * @brief printf-style front end over an optional sink.
 *
 * Debug lines are dropped unless verbose tracing is enabled.
 */
class Epd27Logger {

public:

    Epd27Logger(Epd27LogSink* sink, const char* tag, bool debug = false);

    void setDebug(bool enabled) { debug = enabled; }
    bool isDebug() const { return debug; }

    void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void warn(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void debugf(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

private:

    void vwrite(Epd27LogLevel level, const char* fmt, va_list args);

    Epd27LogSink* sink;
    const char* tag;
    bool debug;

    static const int LOG_LINE_MAX = 128;
};
