/**
 * @file epd27_spi_transport.cpp
 * @brief ESP-IDF SPI + GPIO transport for the 2.7" e-paper.
 */

#include "epd27_spi_transport.h"
#include "epd27_types.h"
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>


static const char* TAG = "EPD27_SPI";


/*
 * =============================================================================
 * CONSTRUCTOR / DESTRUCTOR
 * =============================================================================
 */
Epd27SpiTransport::Epd27SpiTransport(const Config& config)
    : config(config),
      spiDevice(nullptr),
      initialized(false)
{
}


Epd27SpiTransport::~Epd27SpiTransport() {
    if (initialized && spiDevice) {
        spi_bus_remove_device(spiDevice);
        spi_bus_free(config.spiHost);
    }
}


/*
 * =============================================================================
 * INITIALIZATION
 * =============================================================================
 */
bool Epd27SpiTransport::init() {
    ESP_LOGI(TAG, "Initializing transport (MOSI=%d, SCK=%d, CS=%d, DC=%d, RST=%d, BUSY=%d)",
             config.mosiPin, config.sckPin, config.csPin,
             config.dcPin, config.rstPin, config.busyPin);

    /*
     * -------------------------------------------------------------------------
     * STEP 1: Configure control pins
     * -------------------------------------------------------------------------
     */
    gpio_config_t io_conf = {};
    io_conf.mode = GPIO_MODE_OUTPUT;
    io_conf.pull_up_en = GPIO_PULLUP_DISABLE;
    io_conf.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io_conf.intr_type = GPIO_INTR_DISABLE;
    io_conf.pin_bit_mask = (1ULL << config.csPin) | (1ULL << config.dcPin) | (1ULL << config.rstPin);

    esp_err_t err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Output pin config failed: %s", esp_err_to_name(err));
        return false;
    }

    // BUSY pin (input!)
    io_conf.mode = GPIO_MODE_INPUT;
    io_conf.pin_bit_mask = (1ULL << config.busyPin);

    err = gpio_config(&io_conf);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "BUSY pin config failed: %s", esp_err_to_name(err));
        return false;
    }

    // Idle levels: CS released, command mode, out of reset
    gpio_set_level(config.csPin, 1);
    gpio_set_level(config.dcPin, 0);
    gpio_set_level(config.rstPin, 1);

    /*
     * -------------------------------------------------------------------------
     * STEP 2: Configure SPI bus
     * -------------------------------------------------------------------------
     */
    spi_bus_config_t busConfig = {};
    busConfig.mosi_io_num = config.mosiPin;
    busConfig.miso_io_num = -1;
    busConfig.sclk_io_num = config.sckPin;
    busConfig.quadwp_io_num = -1;
    busConfig.quadhd_io_num = -1;
    busConfig.max_transfer_sz = EPD27_CHUNK_SIZE;

    err = spi_bus_initialize(config.spiHost, &busConfig, SPI_DMA_CH_AUTO);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI bus init failed: %s", esp_err_to_name(err));
        return false;
    }

    /*
     * -------------------------------------------------------------------------
     * STEP 3: Add SPI device (CS handled in software)
     * -------------------------------------------------------------------------
     */
    spi_device_interface_config_t devConfig = {};
    devConfig.clock_speed_hz = config.clockSpeedHz;
    devConfig.mode = 0;
    devConfig.spics_io_num = -1;
    devConfig.queue_size = 1;

    err = spi_bus_add_device(config.spiHost, &devConfig, &spiDevice);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI device add failed: %s", esp_err_to_name(err));
        spi_bus_free(config.spiHost);
        return false;
    }

    initialized = true;
    ESP_LOGI(TAG, "Transport ready (%d Hz)", config.clockSpeedHz);
    return true;
}


/*
 * =============================================================================
 * LINES
 * =============================================================================
 */

void Epd27SpiTransport::assertCs() {
    gpio_set_level(config.csPin, 0);
}


void Epd27SpiTransport::deassertCs() {
    gpio_set_level(config.csPin, 1);
}


void Epd27SpiTransport::setDc(bool data) {
    gpio_set_level(config.dcPin, data ? 1 : 0);
}


bool Epd27SpiTransport::readBusy() {
    return gpio_get_level(config.busyPin) == config.busyActiveLevel;
}


void Epd27SpiTransport::pulseReset() {
    gpio_set_level(config.rstPin, 1);
    vTaskDelay(pdMS_TO_TICKS(200));
    gpio_set_level(config.rstPin, 0);
    vTaskDelay(pdMS_TO_TICKS(2));
    gpio_set_level(config.rstPin, 1);
    vTaskDelay(pdMS_TO_TICKS(200));
}


void Epd27SpiTransport::delayMs(uint32_t ms) {
    TickType_t ticks = pdMS_TO_TICKS(ms);
    vTaskDelay(ticks > 0 ? ticks : 1);
}


/*
 * =============================================================================
 * DATA
 * =============================================================================
 */

bool Epd27SpiTransport::write(const uint8_t* data, size_t len) {
    if (!initialized) {
        ESP_LOGE(TAG, "write() before init()");
        return false;
    }
    if (len == 0) return true;

    spi_transaction_t trans = {};
    trans.length = len * 8;
    trans.tx_buffer = data;

    esp_err_t err = spi_device_polling_transmit(spiDevice, &trans);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "SPI transmit failed: %s", esp_err_to_name(err));
        return false;
    }
    return true;
}
