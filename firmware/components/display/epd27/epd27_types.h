/**
 * @file epd27_types.h
 * @brief Shared constants, colors, rotations and error codes for the
 *        2.7" e-paper engine.
 *
 * @details
 * Panel: 176x264 black/white, SSD1680-class controller (Waveshare 2.7"
 * GDEW027W3 / GDEY027T91 family).
 *
 * Nothing in this header depends on ESP-IDF, so the whole rendering engine
 * builds and runs on a host as well as on the ESP32.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>


/**
 * @brief Physical panel resolution (portrait, as stored in panel RAM).
 */
#define EPD27_WIDTH         176
#define EPD27_HEIGHT        264

/**
 * @brief Bytes per physical row and total frame buffer size.
 *
 * (176 + 7) / 8 = 22 bytes per row, 22 * 264 = 5808 bytes.
 */
#define EPD27_STRIDE        ((EPD27_WIDTH + 7) / 8)
#define EPD27_BUFFER_SIZE   (EPD27_STRIDE * EPD27_HEIGHT)

/**
 * @brief Maximum bytes handed to the transport in one write() call.
 */
#define EPD27_CHUNK_SIZE    64


/**
 * @brief Pixel colors.
 *
 * The values equal the bit stored in panel RAM: a set bit is white,
 * a cleared bit is black. The raw buffer can be sent to the panel as-is.
 */
enum Epd27Color : uint8_t {
    EPD27_BLACK = 0,
    EPD27_WHITE = 1,
};


/**
 * @brief Logical orientation. Rotation is clockwise.
 */
enum Epd27Rotation : uint8_t {
    EPD27_ROTATE_0   = 0,
    EPD27_ROTATE_90  = 1,
    EPD27_ROTATE_180 = 2,
    EPD27_ROTATE_270 = 3,
};


/**
 * @brief Controller state machine.
 */
enum Epd27State : uint8_t {
    EPD27_STATE_UNINITIALIZED = 0,
    EPD27_STATE_AWAKE,
    EPD27_STATE_BUSY,
    EPD27_STATE_ASLEEP,
};


/**
 * @brief Error codes returned by the engine (esp_err_t style, 0 = success).
 */
enum Epd27Err : int {
    EPD27_OK = 0,
    EPD27_ERR_NOT_INITIALIZED,      ///< Call made before init()
    EPD27_ERR_ASLEEP,               ///< Call made while in deep sleep
    EPD27_ERR_TIMEOUT,              ///< BUSY never released
    EPD27_ERR_UNSUPPORTED_FORMAT,   ///< Bitmap is not 1-bit uncompressed, or truncated
    EPD27_ERR_BUS,                  ///< Transport rejected a write
    EPD27_ERR_NO_MEM,               ///< Frame buffer allocation failed
};


/**
 * @brief Human readable name for an error code (like esp_err_to_name).
 */
const char* epd27ErrToName(Epd27Err err);


/**
 * @brief Human readable name for a state.
 */
const char* epd27StateToName(Epd27State state);
