/**
 * @file epd27_framebuffer.h
 * @brief Packed 1-bit frame buffer in the panel's physical layout.
 *
 * @details
 * Memory layout (MONO_HLSB, same as panel RAM):
 *
 *     row y:  [ byte 0    ][ byte 1    ]  ...  [ byte 21     ]
 *              x=0 .. x=7   x=8 .. x=15          x=168 .. x=175
 *              MSB    LSB
 *
 *     byte index = y * 22 + x / 8
 *     bit mask   = 0x80 >> (x % 8)
 *     bit 1 = white, bit 0 = black
 *
 * The buffer is always 176x264. Rotation only changes how logical
 * coordinates are mapped onto it (see epd27_orientation.h).
 *
 * The 5,808 bytes live on the heap, so an Epd27 can sit on a task stack.
 */

#pragma once

#include "epd27_types.h"


class Epd27FrameBuffer {

public:

    /**
     * @brief Create a buffer with every pixel set to @p fill.
     */
    explicit Epd27FrameBuffer(Epd27Color fill = EPD27_WHITE);
    ~Epd27FrameBuffer();

    Epd27FrameBuffer(const Epd27FrameBuffer&) = delete;
    Epd27FrameBuffer& operator=(const Epd27FrameBuffer&) = delete;

    /**
     * @brief False if the pixel memory could not be allocated. Every other
     *        call is then a no-op (reads return WHITE).
     */
    bool isAllocated() const { return pixels != nullptr; }

    /**
     * @brief Set one physical pixel. Out-of-range coordinates are ignored.
     */
    void setPixel(int px, int py, Epd27Color color);

    /**
     * @brief Read one physical pixel. Out-of-range coordinates read WHITE.
     */
    Epd27Color getPixel(int px, int py) const;

    /**
     * @brief Set every pixel with a single memset.
     */
    void fill(Epd27Color color);

    /**
     * @brief Packed bytes in transmission order.
     */
    const uint8_t* data() const { return pixels; }

    size_t size() const { return EPD27_BUFFER_SIZE; }

private:

    uint8_t* pixels;
};
