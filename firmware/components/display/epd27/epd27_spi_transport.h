/**
 * @file epd27_spi_transport.h
 * @brief ESP-IDF implementation of Epd27Transport (SPI master + GPIO).
 *
 * @details
 * Wiring (Waveshare 2.7" HAT to ESP-WROOM-32, defaults below):
 *
 *     Module    ESP32
 *     ──────    ─────────
 *     VCC       3.3V
 *     GND       GND
 *     DIN       GPIO 23  (MOSI)
 *     CLK       GPIO 18  (SCK)
 *     CS        GPIO 5
 *     DC        GPIO 2
 *     RST       GPIO 4
 *     BUSY      GPIO 15  (input)
 *
 * CS is driven as a plain GPIO (not by the SPI peripheral) so one CS window
 * can span several SPI transactions, as chunked frame writes need.
 */

#pragma once

#include "epd27_transport.h"
#include <driver/spi_master.h>
#include <driver/gpio.h>


class Epd27SpiTransport : public Epd27Transport {

public:

    struct Config {
        spi_host_device_t spiHost = SPI2_HOST;
        gpio_num_t mosiPin = GPIO_NUM_23;
        gpio_num_t sckPin  = GPIO_NUM_18;
        gpio_num_t csPin   = GPIO_NUM_5;
        gpio_num_t dcPin   = GPIO_NUM_2;
        gpio_num_t rstPin  = GPIO_NUM_4;
        gpio_num_t busyPin = GPIO_NUM_15;

        int clockSpeedHz = 4 * 1000 * 1000;    // 4 MHz (e-paper is slow)
        int busyActiveLevel = 1;                // SSD1680 holds BUSY high while working
    };


    explicit Epd27SpiTransport(const Config& config);

    /**
     * @brief Release the SPI device and bus.
     */
    ~Epd27SpiTransport();

    /**
     * @brief Configure GPIOs and the SPI bus.
     *
     * @return true if successful, false on error.
     */
    bool init();

    void assertCs() override;
    void deassertCs() override;
    void setDc(bool data) override;
    bool write(const uint8_t* data, size_t len) override;
    bool readBusy() override;
    void pulseReset() override;
    void delayMs(uint32_t ms) override;

private:

    Config config;
    spi_device_handle_t spiDevice;
    bool initialized;
};
