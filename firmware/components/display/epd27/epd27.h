/**
 * @file epd27.h
 * @brief 2.7" black/white e-paper display (176x264, SSD1680) with a
 *        1-bit frame buffer and drawing primitives.
 *
 * @details
 * Draw into RAM, then call display() to push the frame to the panel.
 *
 * @note
 * - A full refresh takes 2-3 seconds and blocks the caller.
 * - The panel keeps its image without power.
 * - No partial refresh: every display() is a full refresh.
 *
 * @par Supported hardware
 * - Waveshare 2.7" e-Paper (GDEW027W3 / GDEY027T91 glass, SSD1680)
 */

/*
 * =============================================================================
 * HOW TO USE
 * =============================================================================
 *
 *     Epd27SpiTransport::Config pins;           // defaults: CS=5 DC=2 RST=4 BUSY=15
 *     Epd27SpiTransport transport(pins);
 *     transport.init();
 *
 *     Epd27EspLogSink logSink;
 *     Epd27Config config;
 *     config.rotation = 1;                      // landscape 264x176
 *
 *     Epd27 epd(transport, config, &logSink);
 *     epd.init();
 *
 *     epd.fill(EPD27_WHITE);
 *     epd.drawString(10, 10, "Hello", EPD27_BLACK);
 *     epd.display();                            // ~2 s
 *     epd.sleep();
 *
 * =============================================================================
 * STATE MACHINE
 * =============================================================================
 *
 *                      init()
 *     UNINITIALIZED ───────────────► AWAKE ◄──────┐
 *                                    │  ▲         │ BUSY released
 *                 display()/clear()/ │  │         │
 *                      fillBlack()   ▼  │         │
 *                                    BUSY ────────┘
 *                                    │
 *                   sleep()          ▼
 *                                  ASLEEP ──── resetDisplay() ──► AWAKE
 *
 *     UNINITIALIZED: everything except init()/resetDisplay() returns
 *                    EPD27_ERR_NOT_INITIALIZED
 *     ASLEEP:        everything except init()/resetDisplay() returns
 *                    EPD27_ERR_ASLEEP
 *
 * =============================================================================
 * ROTATION
 * =============================================================================
 *
 * The frame buffer always holds the panel's portrait layout. Rotation only
 * changes how the coordinates of later drawing calls are mapped, so
 * switching rotation never moves pixels that are already drawn, and
 * display() sends the buffer as-is in every orientation.
 *
 * =============================================================================
 */

#pragma once

#include "epd27_types.h"
#include "epd27_transport.h"
#include "epd27_log.h"
#include "epd27_framebuffer.h"
#include "epd27_gfx.h"
#include "epd27_bus.h"


/**
 * @brief Construction options.
 */
struct Epd27Config {
    uint8_t rotation = 0;               ///< 0..3 = 0 / 90 / 180 / 270 degrees
    bool debug = false;                 ///< Trace every command and busy wait
    uint32_t busyPollMs = 10;           ///< BUSY sampling interval
    uint32_t busyTimeoutMs = 20000;     ///< Give up on BUSY after this long
};


class Epd27 {

public:

    /**
     * @brief Construct a display on top of a transport.
     *
     * @param transport Hardware port. Must outlive the display; owned
     *                  exclusively by this instance.
     * @param config Rotation, tracing and busy timing.
     * @param logSink Where log lines go (nullptr = silent).
     */
    Epd27(Epd27Transport& transport, const Epd27Config& config = Epd27Config(),
          Epd27LogSink* logSink = nullptr);


    /*
     * -------------------------------------------------------------------------
     * Panel control
     * -------------------------------------------------------------------------
     */

    /**
     * @brief Reset the panel and run the power-on sequence.
     *
     * Does nothing if already awake.
     *
     * @return EPD27_OK, EPD27_ERR_TIMEOUT or EPD27_ERR_BUS.
     */
    Epd27Err init();

    /**
     * @brief Send the frame buffer to the panel and refresh.
     *
     * @note Blocks for the whole refresh (~2 seconds).
     */
    Epd27Err display();

    /**
     * @brief Fill the buffer with white and refresh.
     */
    Epd27Err clear();

    /**
     * @brief Fill the buffer with black and refresh.
     */
    Epd27Err fillBlack();

    /**
     * @brief Put the panel into deep sleep.
     *
     * @note Only resetDisplay() (or init()) wakes it again.
     */
    Epd27Err sleep();

    /**
     * @brief Hardware reset, re-run init() and clear to white.
     *
     * Valid from any state.
     */
    Epd27Err resetDisplay();

    /**
     * @brief Set rotation for later drawing calls.
     *
     * @param rotation 0, 1, 2, or 3 (0° / 90° / 180° / 270°).
     */
    Epd27Err setRotation(uint8_t rotation);

    Epd27Rotation getRotation() const { return gfx.getRotation(); }

    /**
     * @brief Get display width (changes with rotation).
     */
    uint16_t getWidth() const { return (uint16_t)gfx.getWidth(); }

    /**
     * @brief Get display height (changes with rotation).
     */
    uint16_t getHeight() const { return (uint16_t)gfx.getHeight(); }

    Epd27State getState() const { return state; }

    /**
     * @brief Read-only view of the packed buffer (physical layout).
     */
    const Epd27FrameBuffer& getFrameBuffer() const { return frameBuffer; }

    /**
     * @brief Replace the built-in 5x7 font.
     */
    void setFont(const Epd27GlyphSource* font) { gfx.setFont(font); }


    /*
     * -------------------------------------------------------------------------
     * Drawing (buffer only, nothing is sent until display())
     * -------------------------------------------------------------------------
     */

    /**
     * @brief Fill the whole buffer without refreshing.
     */
    Epd27Err fill(Epd27Color color);

    Epd27Err drawPixel(int x, int y, Epd27Color color);

    /**
     * @brief Read back a logical pixel. Off-canvas reads WHITE.
     */
    Epd27Color getPixel(int x, int y) const { return gfx.getPixel(x, y); }

    Epd27Err drawHLine(int x, int y, int w, Epd27Color color);

    Epd27Err drawVLine(int x, int y, int h, Epd27Color color);

    Epd27Err drawLine(int x0, int y0, int x1, int y1, Epd27Color color);

    Epd27Err drawRect(int x, int y, int w, int h, Epd27Color color);

    Epd27Err fillRect(int x, int y, int w, int h, Epd27Color color);

    Epd27Err drawCircle(int cx, int cy, int radius, Epd27Color color);

    Epd27Err fillCircle(int cx, int cy, int radius, Epd27Color color);

    /**
     * @brief Draw a string.
     *
     * @param size Font scale (1 = 5x7 in a 6x8 cell, 2 = 12x16 cell, ...)
     */
    Epd27Err drawString(int x, int y, const char* str, Epd27Color color, uint8_t size = 1);

    /**
     * @brief Decode a 1-bit BMP file and blit it at (x, y).
     *
     * @return EPD27_ERR_UNSUPPORTED_FORMAT (buffer untouched) if the file is
     *         not a 1-bit uncompressed BMP or is truncated.
     */
    Epd27Err drawBmp(const uint8_t* file, size_t len, int x, int y);

    /**
     * @brief Blit an already decoded 1-bit bitmap at (x, y).
     */
    Epd27Err drawBitmap(const Epd27Bitmap& bitmap, int x, int y);

private:

    Epd27Logger log;
    Epd27Bus bus;
    Epd27FrameBuffer frameBuffer;
    Epd27Gfx gfx;
    Epd27State state;


    /**
     * @brief EPD27_OK if awake, else the error for the current state.
     */
    Epd27Err checkAwake() const;

    /**
     * @brief Refresh with the state set to BUSY for the duration.
     */
    Epd27Err refresh();

    /**
     * @brief Fill buffer and panel RAM with one color, then refresh.
     */
    Epd27Err showSolid(Epd27Color color);
};
