/**
 * @file epd27_log.cpp
 * @brief Formatting front end for the injected log sink.
 */

#include "epd27_log.h"
#include <stdarg.h>
#include <stdio.h>


Epd27Logger::Epd27Logger(Epd27LogSink* sink, const char* tag, bool debug)
    : sink(sink),
      tag(tag),
      debug(debug)
{
}


void Epd27Logger::vwrite(Epd27LogLevel level, const char* fmt, va_list args) {
    if (!sink) return;

    char line[LOG_LINE_MAX];
    vsnprintf(line, sizeof(line), fmt, args);
    sink->write(level, tag, line);
}


void Epd27Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(EPD27_LOG_ERROR, fmt, args);
    va_end(args);
}


void Epd27Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(EPD27_LOG_WARN, fmt, args);
    va_end(args);
}


void Epd27Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(EPD27_LOG_INFO, fmt, args);
    va_end(args);
}


void Epd27Logger::debugf(const char* fmt, ...) {
    if (!debug) return;

    va_list args;
    va_start(args, fmt);
    vwrite(EPD27_LOG_DEBUG, fmt, args);
    va_end(args);
}
