/**
 * @file epd27_bus.h
 * @brief SSD1680 command/data framing and panel command sequences.
 *
 * @details
 * Two message kinds go over the wire, always inside a CS low..high window:
 *
 *     COMMAND:  DC=0  [opcode]
 *     DATA:     DC=1  [byte 0] [byte 1] ... [byte N-1]
 *
 * Long data runs (the 5808-byte frame) are handed to the transport in
 * EPD27_CHUNK_SIZE pieces inside one CS window, so the panel sees exactly
 * the same bytes as one big transfer.
 *
 * After commands that start internal work (software reset, waveform load,
 * refresh) the panel holds BUSY until it is done. waitBusy() polls it with
 * a fixed interval and gives up after busyTimeoutMs.
 */

#pragma once

#include "epd27_types.h"
#include "epd27_transport.h"
#include "epd27_log.h"


/*
 * =============================================================================
 * SSD1680 COMMAND DEFINITIONS
 * =============================================================================
 */

#define EPD27_CMD_DRIVER_OUTPUT_CONTROL     0x01
#define EPD27_CMD_DEEP_SLEEP_MODE           0x10
#define EPD27_CMD_DATA_ENTRY_MODE           0x11
#define EPD27_CMD_SW_RESET                  0x12
#define EPD27_CMD_TEMP_SENSOR_CONTROL       0x18
#define EPD27_CMD_MASTER_ACTIVATION         0x20
#define EPD27_CMD_DISPLAY_UPDATE_CONTROL_2  0x22
#define EPD27_CMD_WRITE_RAM_BW              0x24
#define EPD27_CMD_BORDER_WAVEFORM_CONTROL   0x3C
#define EPD27_CMD_SET_RAM_X_START_END       0x44
#define EPD27_CMD_SET_RAM_Y_START_END       0x45
#define EPD27_CMD_SET_RAM_X_ADDRESS         0x4E
#define EPD27_CMD_SET_RAM_Y_ADDRESS         0x4F


/**
 * @brief Busy-wait timing.
 */
struct Epd27BusConfig {
    uint32_t busyPollMs = 10;           ///< Delay between BUSY samples (0 is treated as 1)
    uint32_t busyTimeoutMs = 20000;     ///< Give up after this much waiting
};


class Epd27Bus {

public:

    Epd27Bus(Epd27Transport& transport, Epd27Logger& log, const Epd27BusConfig& config);


    /*
     * -------------------------------------------------------------------------
     * Framing
     * -------------------------------------------------------------------------
     */

    /**
     * @brief Send one command byte (DC low).
     */
    Epd27Err sendCommand(uint8_t cmd);

    /**
     * @brief Send a command followed by its argument bytes.
     */
    Epd27Err sendCommand(uint8_t cmd, const uint8_t* args, size_t len);

    /**
     * @brief Send data bytes (DC high), chunked.
     */
    Epd27Err sendData(const uint8_t* data, size_t len);

    /**
     * @brief Send @p count copies of @p value as data, chunked.
     */
    Epd27Err sendRepeated(uint8_t value, size_t count);

    /**
     * @brief Poll BUSY until released or the timeout expires.
     *
     * @return EPD27_OK, or EPD27_ERR_TIMEOUT.
     */
    Epd27Err waitBusy();


    /*
     * -------------------------------------------------------------------------
     * Panel sequences
     * -------------------------------------------------------------------------
     */

    /**
     * @brief Reset pulse, software reset, RAM window and waveform load.
     */
    Epd27Err powerOn();

    /**
     * @brief Point the RAM address counters at (0, 0).
     */
    Epd27Err setRamOrigin();

    /**
     * @brief Write a full frame into black/white RAM.
     */
    Epd27Err writeFrame(const uint8_t* frame, size_t len);

    /**
     * @brief Fill black/white RAM with one byte value.
     */
    Epd27Err writeSolid(uint8_t value, size_t len);

    /**
     * @brief Full refresh from RAM. Blocks until BUSY is released.
     */
    Epd27Err refresh();

    /**
     * @brief Enter deep sleep mode 1. Only a hardware reset wakes the panel.
     */
    Epd27Err deepSleep();

private:

    Epd27Transport& transport;
    Epd27Logger& log;
    Epd27BusConfig config;

    Epd27Err writeChunked(const uint8_t* data, size_t len);
};
