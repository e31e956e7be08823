/**
 * @file epd27_framebuffer.cpp
 * @brief Packed 1-bit frame buffer implementation.
 */

#include "epd27_framebuffer.h"
#include <stdlib.h>
#include <string.h>


Epd27FrameBuffer::Epd27FrameBuffer(Epd27Color fill)
    : pixels((uint8_t*)malloc(EPD27_BUFFER_SIZE))
{
    this->fill(fill);
}


Epd27FrameBuffer::~Epd27FrameBuffer() {
    if (pixels) free(pixels);
}


void Epd27FrameBuffer::setPixel(int px, int py, Epd27Color color) {
    if (!pixels) return;
    if (px < 0 || px >= EPD27_WIDTH || py < 0 || py >= EPD27_HEIGHT) return;

    size_t byteIndex = (size_t)py * EPD27_STRIDE + px / 8;
    uint8_t bitMask = 0x80 >> (px % 8);

    if (color == EPD27_WHITE) {
        pixels[byteIndex] |= bitMask;    // Set bit = white
    } else {
        pixels[byteIndex] &= ~bitMask;   // Clear bit = black
    }
}


Epd27Color Epd27FrameBuffer::getPixel(int px, int py) const {
    if (!pixels) return EPD27_WHITE;
    if (px < 0 || px >= EPD27_WIDTH || py < 0 || py >= EPD27_HEIGHT) return EPD27_WHITE;

    size_t byteIndex = (size_t)py * EPD27_STRIDE + px / 8;
    uint8_t bitMask = 0x80 >> (px % 8);

    return (pixels[byteIndex] & bitMask) ? EPD27_WHITE : EPD27_BLACK;
}


void Epd27FrameBuffer::fill(Epd27Color color) {
    if (!pixels) return;
    memset(pixels, (color == EPD27_WHITE) ? 0xFF : 0x00, EPD27_BUFFER_SIZE);
}
