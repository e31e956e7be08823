/**
 * @file bmp1.cpp
 * @brief 1-bit BMP decoder implementation.
 */

#include "bmp1.h"
#include <string.h>
#include <utility>


#define BMP_FILE_HEADER_SIZE    14
#define BMP_INFO_HEADER_MIN     40
#define BMP_BI_RGB              0


static uint16_t readLe16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}


static uint32_t readLe32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}


Epd27Bitmap Bmp1Image::bitmap() const {
    Epd27Bitmap view;
    view.width = width;
    view.height = height;
    view.stride = stride;
    view.rows = rows.empty() ? nullptr : rows.data();
    view.setBitIsWhite = setBitIsWhite;
    return view;
}


Epd27Err bmp1Decode(const uint8_t* data, size_t len, Bmp1Image* out) {
    if (!data || !out) return EPD27_ERR_UNSUPPORTED_FORMAT;
    if (len < BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_MIN) return EPD27_ERR_UNSUPPORTED_FORMAT;

    if (data[0] != 'B' || data[1] != 'M') return EPD27_ERR_UNSUPPORTED_FORMAT;

    uint32_t offBits = readLe32(&data[10]);
    uint32_t infoSize = readLe32(&data[14]);
    int32_t width = (int32_t)readLe32(&data[18]);
    int32_t height = (int32_t)readLe32(&data[22]);
    uint16_t bpp = readLe16(&data[28]);
    uint32_t compression = readLe32(&data[30]);

    if (infoSize < BMP_INFO_HEADER_MIN) return EPD27_ERR_UNSUPPORTED_FORMAT;

    // Pixel data cannot start inside the headers
    if ((uint64_t)offBits < (uint64_t)BMP_FILE_HEADER_SIZE + infoSize) return EPD27_ERR_UNSUPPORTED_FORMAT;
    if (bpp != 1 || compression != BMP_BI_RGB) return EPD27_ERR_UNSUPPORTED_FORMAT;

    // Negative height = rows stored top-down
    bool topDown = height < 0;
    if (width <= 0 || height == 0 || height == INT32_MIN) return EPD27_ERR_UNSUPPORTED_FORMAT;
    if (topDown) height = -height;

    // 64-bit arithmetic: size_t is 32 bits on the ESP32
    uint64_t srcStride = (((uint64_t)width + 31) / 32) * 4;
    uint64_t dstStride = ((uint64_t)width + 7) / 8;
    uint64_t needed = (uint64_t)offBits + srcStride * (uint64_t)(height - 1) + dstStride;
    if (needed > len) return EPD27_ERR_UNSUPPORTED_FORMAT;

    // Palette entry 0 darker than entry 1 means a set bit is white.
    // Without a palette, Windows treats 1-bit images as black/white.
    bool setBitIsWhite = true;
    uint64_t paletteOffset = (uint64_t)BMP_FILE_HEADER_SIZE + infoSize;
    if (paletteOffset + 8 <= offBits && paletteOffset + 8 <= len) {
        const uint8_t* pal = &data[paletteOffset];
        unsigned lum0 = pal[0] + pal[1] + pal[2];
        unsigned lum1 = pal[4] + pal[5] + pal[6];
        setBitIsWhite = lum1 >= lum0;
    }

    Bmp1Image image;
    image.width = width;
    image.height = height;
    image.stride = (size_t)dstStride;
    image.setBitIsWhite = setBitIsWhite;
    image.rows.resize((size_t)(dstStride * (uint64_t)height));

    for (int32_t y = 0; y < height; y++) {
        int32_t srcRow = topDown ? y : (height - 1 - y);
        const uint8_t* src = data + offBits + (size_t)srcStride * srcRow;
        memcpy(&image.rows[(size_t)dstStride * y], src, (size_t)dstStride);
    }

    *out = std::move(image);
    return EPD27_OK;
}
