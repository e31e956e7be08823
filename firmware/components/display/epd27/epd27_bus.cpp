/**
 * @file epd27_bus.cpp
 * @brief SSD1680 framing, busy handling and command sequences.
 *
 * @details
 * Sequences follow the SSD1680 datasheet for a 176x264 glass:
 *
 *     POWER ON
 *         RST pulse
 *         0x12                  software reset          -> BUSY
 *         0x01  07 01 00        263 + 1 gate lines
 *         0x11  03              X inc, Y inc
 *         0x44  00 15           RAM X = byte 0..21
 *         0x45  00 00 07 01     RAM Y = line 0..263
 *         0x3C  05              border waveform
 *         0x18  80              internal temperature sensor
 *         0x22  B1, 0x20        load temperature + waveform -> BUSY
 *         0x4E  00, 0x4F 00 00  RAM counters to origin
 *
 *     FRAME
 *         0x4E  00, 0x4F 00 00
 *         0x24  <5808 bytes>
 *
 *     REFRESH
 *         0x22  C7, 0x20        full update                 -> BUSY
 *
 *     SLEEP
 *         0x10  01              deep sleep mode 1
 */

#include "epd27_bus.h"
#include <string.h>


Epd27Bus::Epd27Bus(Epd27Transport& transport, Epd27Logger& log, const Epd27BusConfig& config)
    : transport(transport),
      log(log),
      config(config)
{
    if (this->config.busyPollMs == 0) this->config.busyPollMs = 1;
}


/*
 * =============================================================================
 * FRAMING
 * =============================================================================
 */

Epd27Err Epd27Bus::sendCommand(uint8_t cmd) {
    log.debugf("cmd 0x%02X", cmd);

    transport.setDc(false);  // Command mode
    transport.assertCs();
    bool ok = transport.write(&cmd, 1);
    transport.deassertCs();

    if (!ok) {
        log.error("Write failed for command 0x%02X", cmd);
        return EPD27_ERR_BUS;
    }
    return EPD27_OK;
}


Epd27Err Epd27Bus::sendCommand(uint8_t cmd, const uint8_t* args, size_t len) {
    Epd27Err err = sendCommand(cmd);
    if (err != EPD27_OK) return err;
    if (len == 0) return EPD27_OK;
    return sendData(args, len);
}


Epd27Err Epd27Bus::writeChunked(const uint8_t* data, size_t len) {
    size_t offset = 0;

    while (offset < len) {
        size_t n = len - offset;
        if (n > EPD27_CHUNK_SIZE) n = EPD27_CHUNK_SIZE;

        if (!transport.write(data + offset, n)) {
            log.error("Write failed at data offset %u of %u", (unsigned)offset, (unsigned)len);
            return EPD27_ERR_BUS;
        }
        offset += n;
    }
    return EPD27_OK;
}


Epd27Err Epd27Bus::sendData(const uint8_t* data, size_t len) {
    log.debugf("data %u bytes", (unsigned)len);

    transport.setDc(true);  // Data mode
    transport.assertCs();
    Epd27Err err = writeChunked(data, len);
    transport.deassertCs();

    return err;
}


Epd27Err Epd27Bus::sendRepeated(uint8_t value, size_t count) {
    log.debugf("data %u x 0x%02X", (unsigned)count, value);

    uint8_t block[EPD27_CHUNK_SIZE];
    memset(block, value, sizeof(block));

    transport.setDc(true);
    transport.assertCs();

    Epd27Err err = EPD27_OK;
    size_t remaining = count;

    while (remaining > 0) {
        size_t n = remaining > sizeof(block) ? sizeof(block) : remaining;
        if (!transport.write(block, n)) {
            log.error("Write failed with %u of %u bytes left", (unsigned)remaining, (unsigned)count);
            err = EPD27_ERR_BUS;
            break;
        }
        remaining -= n;
    }

    transport.deassertCs();
    return err;
}


Epd27Err Epd27Bus::waitBusy() {
    uint32_t waited = 0;

    log.debugf("Waiting for BUSY...");

    while (transport.readBusy()) {
        if (waited >= config.busyTimeoutMs) {
            log.error("BUSY still asserted after %u ms", (unsigned)waited);
            return EPD27_ERR_TIMEOUT;
        }
        transport.delayMs(config.busyPollMs);

        // Saturate at the bound: a timeout near UINT32_MAX must not wrap
        uint32_t remaining = config.busyTimeoutMs - waited;
        waited += (config.busyPollMs < remaining) ? config.busyPollMs : remaining;
    }

    log.debugf("BUSY released after %u ms", (unsigned)waited);
    return EPD27_OK;
}


/*
 * =============================================================================
 * PANEL SEQUENCES
 * =============================================================================
 */

Epd27Err Epd27Bus::powerOn() {
    transport.pulseReset();

    Epd27Err err = sendCommand(EPD27_CMD_SW_RESET);
    if (err != EPD27_OK) return err;
    transport.delayMs(10);
    err = waitBusy();
    if (err != EPD27_OK) return err;

    static const uint8_t driverOutput[] = {
        (EPD27_HEIGHT - 1) & 0xFF,
        ((EPD27_HEIGHT - 1) >> 8) & 0xFF,
        0x00,
    };
    err = sendCommand(EPD27_CMD_DRIVER_OUTPUT_CONTROL, driverOutput, sizeof(driverOutput));
    if (err != EPD27_OK) return err;

    static const uint8_t dataEntry[] = { 0x03 };
    err = sendCommand(EPD27_CMD_DATA_ENTRY_MODE, dataEntry, sizeof(dataEntry));
    if (err != EPD27_OK) return err;

    static const uint8_t ramX[] = { 0x00, (EPD27_WIDTH - 1) / 8 };
    err = sendCommand(EPD27_CMD_SET_RAM_X_START_END, ramX, sizeof(ramX));
    if (err != EPD27_OK) return err;

    static const uint8_t ramY[] = {
        0x00,
        0x00,
        (EPD27_HEIGHT - 1) & 0xFF,
        ((EPD27_HEIGHT - 1) >> 8) & 0xFF,
    };
    err = sendCommand(EPD27_CMD_SET_RAM_Y_START_END, ramY, sizeof(ramY));
    if (err != EPD27_OK) return err;

    static const uint8_t border[] = { 0x05 };
    err = sendCommand(EPD27_CMD_BORDER_WAVEFORM_CONTROL, border, sizeof(border));
    if (err != EPD27_OK) return err;

    static const uint8_t tempSensor[] = { 0x80 };  // Internal sensor
    err = sendCommand(EPD27_CMD_TEMP_SENSOR_CONTROL, tempSensor, sizeof(tempSensor));
    if (err != EPD27_OK) return err;

    static const uint8_t loadWaveform[] = { 0xB1 };
    err = sendCommand(EPD27_CMD_DISPLAY_UPDATE_CONTROL_2, loadWaveform, sizeof(loadWaveform));
    if (err != EPD27_OK) return err;
    err = sendCommand(EPD27_CMD_MASTER_ACTIVATION);
    if (err != EPD27_OK) return err;
    err = waitBusy();
    if (err != EPD27_OK) return err;

    return setRamOrigin();
}


Epd27Err Epd27Bus::setRamOrigin() {
    static const uint8_t x[] = { 0x00 };
    static const uint8_t y[] = { 0x00, 0x00 };

    Epd27Err err = sendCommand(EPD27_CMD_SET_RAM_X_ADDRESS, x, sizeof(x));
    if (err != EPD27_OK) return err;
    return sendCommand(EPD27_CMD_SET_RAM_Y_ADDRESS, y, sizeof(y));
}


Epd27Err Epd27Bus::writeFrame(const uint8_t* frame, size_t len) {
    Epd27Err err = setRamOrigin();
    if (err != EPD27_OK) return err;
    err = sendCommand(EPD27_CMD_WRITE_RAM_BW);
    if (err != EPD27_OK) return err;
    return sendData(frame, len);
}


Epd27Err Epd27Bus::writeSolid(uint8_t value, size_t len) {
    Epd27Err err = setRamOrigin();
    if (err != EPD27_OK) return err;
    err = sendCommand(EPD27_CMD_WRITE_RAM_BW);
    if (err != EPD27_OK) return err;
    return sendRepeated(value, len);
}


Epd27Err Epd27Bus::refresh() {
    static const uint8_t fullUpdate[] = { 0xC7 };

    Epd27Err err = sendCommand(EPD27_CMD_DISPLAY_UPDATE_CONTROL_2, fullUpdate, sizeof(fullUpdate));
    if (err != EPD27_OK) return err;
    err = sendCommand(EPD27_CMD_MASTER_ACTIVATION);
    if (err != EPD27_OK) return err;
    return waitBusy();
}


Epd27Err Epd27Bus::deepSleep() {
    static const uint8_t mode1[] = { 0x01 };
    return sendCommand(EPD27_CMD_DEEP_SLEEP_MODE, mode1, sizeof(mode1));
}
