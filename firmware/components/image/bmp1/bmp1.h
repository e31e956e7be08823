/**
 * @file bmp1.h
 * @brief Decoder for 1-bit uncompressed Windows BMP files.
 *
 * @details
 * Accepted layout:
 *
 *     offset  size  field
 *     ──────  ────  ──────────────────────────────
 *        0     2    'B' 'M'
 *       10     4    offset of pixel data (past the headers)
 *       14     4    info header size (>= 40)
 *       18     4    width  (> 0)
 *       22     4    height (> 0 bottom-up, < 0 top-down)
 *       28     2    bits per pixel (must be 1)
 *       30     4    compression (must be 0 = BI_RGB)
 *     14+hdr   8    palette: 2 x (B, G, R, 0)
 *
 * Rows in the file are padded to 4 bytes. The decoded image has top-down
 * rows packed at (width + 7) / 8 bytes.
 */

#pragma once

#include "epd27_types.h"
#include "epd27_gfx.h"
#include <vector>


struct Bmp1Image {
    int width = 0;
    int height = 0;
    size_t stride = 0;              ///< (width + 7) / 8
    bool setBitIsWhite = true;      ///< From the palette
    std::vector<uint8_t> rows;      ///< stride * height bytes, top row first

    /**
     * @brief View usable with Epd27Gfx::drawBitmap(). Valid while the
     *        image is alive and unchanged.
     */
    Epd27Bitmap bitmap() const;
};


/**
 * @brief Decode a BMP file held in memory.
 *
 * @param data File bytes.
 * @param len Number of bytes.
 * @param out Receives the image. Left untouched on failure.
 *
 * @return EPD27_OK, or EPD27_ERR_UNSUPPORTED_FORMAT for anything that is
 *         not a complete 1-bit uncompressed BMP.
 */
Epd27Err bmp1Decode(const uint8_t* data, size_t len, Bmp1Image* out);
