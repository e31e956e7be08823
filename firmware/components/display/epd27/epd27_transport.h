/**
 * @file epd27_transport.h
 * @brief Hardware port the e-paper engine drives.
 *
 * @details
 * The engine never toggles GPIOs or touches the SPI peripheral itself.
 * It only sequences calls on this interface:
 *
 *     CS    ──┐           ┌──   assertCs() / deassertCs()
 *             └───────────┘
 *     DC    ── low = command byte, high = data bytes   setDc()
 *     MOSI  ── bytes                                    write()
 *     RST   ── reset pulse                              pulseReset()
 *     BUSY  ── panel is working                         readBusy()
 *
 * Epd27SpiTransport implements it on the ESP32. Host tests use a fake
 * that records every call.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>


class Epd27Transport {

public:

    virtual ~Epd27Transport() {}

    /**
     * @brief Drive chip-select active (low).
     */
    virtual void assertCs() = 0;

    /**
     * @brief Release chip-select (high).
     */
    virtual void deassertCs() = 0;

    /**
     * @brief Set the data/command line.
     *
     * @param data false = command, true = data.
     */
    virtual void setDc(bool data) = 0;

    /**
     * @brief Clock bytes out on the data line.
     *
     * @return true if the bytes were sent.
     */
    virtual bool write(const uint8_t* data, size_t len) = 0;

    /**
     * @brief Sample the busy line.
     *
     * @return true while the panel is working (polarity handled here).
     */
    virtual bool readBusy() = 0;

    /**
     * @brief Pulse the reset line with the panel's required timing.
     */
    virtual void pulseReset() = 0;

    /**
     * @brief Block for the given number of milliseconds.
     */
    virtual void delayMs(uint32_t ms) = 0;
};
