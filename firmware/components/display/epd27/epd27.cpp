/**
 * @file epd27.cpp
 * @brief 2.7" e-paper display: state machine and drawing front end.
 */

#include "epd27.h"
#include "font5x7.h"
#include "bmp1.h"


static const char* TAG = "EPD27";


/*
 * =============================================================================
 * CONSTRUCTOR
 * =============================================================================
 */
Epd27::Epd27(Epd27Transport& transport, const Epd27Config& config, Epd27LogSink* logSink)
    : log(logSink, TAG, config.debug),
      bus(transport, log, Epd27BusConfig{config.busyPollMs, config.busyTimeoutMs}),
      frameBuffer(EPD27_WHITE),
      gfx(frameBuffer, (Epd27Rotation)(config.rotation & 3)),
      state(EPD27_STATE_UNINITIALIZED)
{
    gfx.setFont(&font5x7());
}


/*
 * =============================================================================
 * STATE CHECKS
 * =============================================================================
 */

Epd27Err Epd27::checkAwake() const {
    switch (state) {
        case EPD27_STATE_AWAKE:
            return EPD27_OK;
        case EPD27_STATE_ASLEEP:
            return EPD27_ERR_ASLEEP;
        case EPD27_STATE_UNINITIALIZED:
        case EPD27_STATE_BUSY:
        default:
            return EPD27_ERR_NOT_INITIALIZED;
    }
}


/*
 * =============================================================================
 * PANEL CONTROL
 * =============================================================================
 */

Epd27Err Epd27::init() {
    if (state == EPD27_STATE_AWAKE) {
        log.debugf("Already initialized");
        return EPD27_OK;
    }

    if (!frameBuffer.isAllocated()) {
        log.error("Failed to allocate frame buffer (%u bytes)", (unsigned)EPD27_BUFFER_SIZE);
        return EPD27_ERR_NO_MEM;
    }

    log.info("Initializing 2.7\" e-paper (%dx%d, rotation %d)",
             gfx.getWidth(), gfx.getHeight(), (int)gfx.getRotation());

    Epd27Err err = bus.powerOn();
    if (err != EPD27_OK) {
        log.error("Init failed: %s", epd27ErrToName(err));
        return err;
    }

    state = EPD27_STATE_AWAKE;
    log.info("E-Paper initialized (buffer: %u bytes)", (unsigned)frameBuffer.size());
    return EPD27_OK;
}


Epd27Err Epd27::refresh() {
    state = EPD27_STATE_BUSY;
    Epd27Err err = bus.refresh();
    state = EPD27_STATE_AWAKE;

    if (err != EPD27_OK) {
        log.error("Refresh failed: %s", epd27ErrToName(err));
        return err;
    }
    log.info("Display update complete");
    return EPD27_OK;
}


Epd27Err Epd27::display() {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;

    log.info("Updating display (this takes ~2 seconds)...");

    err = bus.writeFrame(frameBuffer.data(), frameBuffer.size());
    if (err != EPD27_OK) {
        log.error("Frame write failed: %s", epd27ErrToName(err));
        return err;
    }
    return refresh();
}


Epd27Err Epd27::showSolid(Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;

    frameBuffer.fill(color);

    // Whole frame is one value: stream it without touching the buffer
    err = bus.writeSolid(color == EPD27_WHITE ? 0xFF : 0x00, frameBuffer.size());
    if (err != EPD27_OK) {
        log.error("Frame write failed: %s", epd27ErrToName(err));
        return err;
    }
    return refresh();
}


Epd27Err Epd27::clear() {
    log.info("Clearing display to white");
    return showSolid(EPD27_WHITE);
}


Epd27Err Epd27::fillBlack() {
    log.info("Filling display with black");
    return showSolid(EPD27_BLACK);
}


Epd27Err Epd27::sleep() {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;

    // Let any operation still running on the panel finish first
    err = bus.waitBusy();
    if (err != EPD27_OK) return err;

    err = bus.deepSleep();
    if (err != EPD27_OK) {
        log.error("Deep sleep command failed: %s", epd27ErrToName(err));
        return err;
    }

    state = EPD27_STATE_ASLEEP;
    log.info("Display entering deep sleep");
    return EPD27_OK;
}


Epd27Err Epd27::resetDisplay() {
    log.info("Resetting display...");

    state = EPD27_STATE_UNINITIALIZED;
    Epd27Err err = init();
    if (err != EPD27_OK) return err;

    err = clear();
    if (err != EPD27_OK) return err;

    log.info("Display reset complete");
    return EPD27_OK;
}


Epd27Err Epd27::setRotation(uint8_t rotation) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;

    gfx.setRotation((Epd27Rotation)(rotation & 3));
    log.debugf("Rotation %d (%dx%d)", (int)gfx.getRotation(), gfx.getWidth(), gfx.getHeight());
    return EPD27_OK;
}


/*
 * =============================================================================
 * DRAWING
 * =============================================================================
 */

Epd27Err Epd27::fill(Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    frameBuffer.fill(color);
    return EPD27_OK;
}


Epd27Err Epd27::drawPixel(int x, int y, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawPixel(x, y, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawHLine(int x, int y, int w, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawHLine(x, y, w, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawVLine(int x, int y, int h, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawVLine(x, y, h, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawLine(int x0, int y0, int x1, int y1, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawLine(x0, y0, x1, y1, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawRect(int x, int y, int w, int h, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawRect(x, y, w, h, color);
    return EPD27_OK;
}


Epd27Err Epd27::fillRect(int x, int y, int w, int h, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.fillRect(x, y, w, h, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawCircle(int cx, int cy, int radius, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawCircle(cx, cy, radius, color);
    return EPD27_OK;
}


Epd27Err Epd27::fillCircle(int cx, int cy, int radius, Epd27Color color) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.fillCircle(cx, cy, radius, color);
    return EPD27_OK;
}


Epd27Err Epd27::drawString(int x, int y, const char* str, Epd27Color color, uint8_t size) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawString(x, y, str, color, size);
    return EPD27_OK;
}


Epd27Err Epd27::drawBmp(const uint8_t* file, size_t len, int x, int y) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;

    Bmp1Image image;
    err = bmp1Decode(file, len, &image);
    if (err != EPD27_OK) {
        log.warn("BMP rejected: %s", epd27ErrToName(err));
        return err;
    }

    log.debugf("BMP %dx%d at (%d, %d)", image.width, image.height, x, y);
    gfx.drawBitmap(image.bitmap(), x, y);
    return EPD27_OK;
}


Epd27Err Epd27::drawBitmap(const Epd27Bitmap& bitmap, int x, int y) {
    Epd27Err err = checkAwake();
    if (err != EPD27_OK) return err;
    gfx.drawBitmap(bitmap, x, y);
    return EPD27_OK;
}
