/**
 * @file epd27_gfx.cpp
 * @brief Drawing primitives implementation.
 */

#include "epd27_gfx.h"
#include "epd27_orientation.h"
#include <stdlib.h>


Epd27Gfx::Epd27Gfx(Epd27FrameBuffer& frameBuffer, Epd27Rotation rotation)
    : frameBuffer(frameBuffer),
      font(nullptr),
      rotation(rotation),
      width(EPD27_WIDTH),
      height(EPD27_HEIGHT)
{
    setRotation(rotation);
}


void Epd27Gfx::setRotation(Epd27Rotation r) {
    rotation = (Epd27Rotation)(r & 3);
    epd27LogicalSize(rotation, &width, &height);
}


/*
 * =============================================================================
 * PIXELS AND RUNS
 * =============================================================================
 */

void Epd27Gfx::drawPixel(int x, int y, Epd27Color color) {
    int px, py;
    epd27ToPhysical(rotation, x, y, &px, &py);
    frameBuffer.setPixel(px, py, color);
}


Epd27Color Epd27Gfx::getPixel(int x, int y) const {
    int px, py;
    epd27ToPhysical(rotation, x, y, &px, &py);
    return frameBuffer.getPixel(px, py);
}


void Epd27Gfx::plot(long long x, long long y, Epd27Color color) {
    if (x < 0 || x >= width || y < 0 || y >= height) return;
    drawPixel((int)x, (int)y, color);
}


void Epd27Gfx::hRun(long long x, long long y, long long w, Epd27Color color) {
    if (w <= 0 || y < 0 || y >= height) return;

    // Only the part of the run that lands on the canvas is walked
    long long start = x;
    long long end = x + w;
    if (start < 0) start = 0;
    if (end > width) end = width;

    for (long long i = start; i < end; i++) {
        drawPixel((int)i, (int)y, color);
    }
}


void Epd27Gfx::vRun(long long x, long long y, long long h, Epd27Color color) {
    if (h <= 0 || x < 0 || x >= width) return;

    long long start = y;
    long long end = y + h;
    if (start < 0) start = 0;
    if (end > height) end = height;

    for (long long i = start; i < end; i++) {
        drawPixel((int)x, (int)i, color);
    }
}


void Epd27Gfx::fillArea(long long x, long long y, long long w, long long h, Epd27Color color) {
    if (w <= 0 || h <= 0) return;

    long long top = y < 0 ? 0 : y;
    long long bottom = y + h;
    if (bottom > height) bottom = height;

    for (long long row = top; row < bottom; row++) {
        hRun(x, row, w, color);
    }
}


void Epd27Gfx::drawHLine(int x, int y, int w, Epd27Color color) {
    hRun(x, y, w, color);
}


void Epd27Gfx::drawVLine(int x, int y, int h, Epd27Color color) {
    vRun(x, y, h, color);
}


/*
 * =============================================================================
 * SHAPES
 * =============================================================================
 */

void Epd27Gfx::drawLine(int ax, int ay, int bx, int by, Epd27Color color) {
    long long x0 = ax, y0 = ay, x1 = bx, y1 = by;

    // Always walk left to right (then top to bottom) so the endpoint
    // order cannot change which pixels Bresenham picks
    if (x0 > x1 || (x0 == x1 && y0 > y1)) {
        long long t = x0; x0 = x1; x1 = t;
        t = y0; y0 = y1; y1 = t;
    }

    // Entirely beside the canvas
    if (x1 < 0 || x0 >= width) return;
    if ((y0 < 0 && y1 < 0) || (y0 >= height && y1 >= height)) return;

    if (y0 == y1) {
        hRun(x0, y0, x1 - x0 + 1, color);
        return;
    }
    if (x0 == x1) {
        vRun(x0, y0, y1 - y0 + 1, color);
        return;
    }

    long long dx = x1 - x0;
    long long dy = llabs(y1 - y0);
    long long sy = (y0 < y1) ? 1 : -1;
    long long err = dx - dy;

    while (true) {
        plot(x0, y0, color);
        if (x0 == x1 && y0 == y1) break;

        // x only grows and y only moves one way: nothing further is on the canvas
        if (x0 >= width) break;
        if ((sy > 0 && y0 >= height) || (sy < 0 && y0 < 0)) break;

        long long e2 = 2 * err;
        if (e2 > -dy) { err -= dy; x0++; }
        if (e2 < dx) { err += dx; y0 += sy; }
    }
}


void Epd27Gfx::drawRect(int x, int y, int w, int h, Epd27Color color) {
    if (w < 0 || h < 0) return;
    if (w == 0) w = 1;
    if (h == 0) h = 1;

    hRun(x, y, w, color);
    hRun(x, (long long)y + h - 1, w, color);
    vRun(x, y, h, color);
    vRun((long long)x + w - 1, y, h, color);
}


void Epd27Gfx::fillRect(int x, int y, int w, int h, Epd27Color color) {
    fillArea(x, y, w, h, color);
}


void Epd27Gfx::drawCircle(int centerX, int centerY, int radius, Epd27Color color) {
    if (radius < 0) return;

    long long cx = centerX, cy = centerY;
    if (cx + radius < 0 || cx - radius >= width) return;
    if (cy + radius < 0 || cy - radius >= height) return;

    long long x = radius;
    long long y = 0;
    long long err = 0;

    while (x >= y) {
        plot(cx + x, cy + y, color);
        plot(cx + y, cy + x, color);
        plot(cx - y, cy + x, color);
        plot(cx - x, cy + y, color);
        plot(cx - x, cy - y, color);
        plot(cx - y, cy - x, color);
        plot(cx + y, cy - x, color);
        plot(cx + x, cy - y, color);

        y++;
        if (err <= 0) err += 2 * y + 1;
        if (err > 0) { x--; err -= 2 * x + 1; }
    }
}


void Epd27Gfx::fillCircle(int centerX, int centerY, int radius, Epd27Color color) {
    if (radius < 0) return;

    long long cx = centerX, cy = centerY;
    if (cx + radius < 0 || cx - radius >= width) return;
    if (cy + radius < 0 || cy - radius >= height) return;

    vRun(cx, cy - radius, 2LL * radius + 1, color);

    long long x = radius;
    long long y = 0;
    long long err = 0;

    while (x >= y) {
        vRun(cx + x, cy - y, 2 * y + 1, color);
        vRun(cx - x, cy - y, 2 * y + 1, color);
        vRun(cx + y, cy - x, 2 * x + 1, color);
        vRun(cx - y, cy - x, 2 * x + 1, color);

        y++;
        if (err <= 0) err += 2 * y + 1;
        if (err > 0) { x--; err -= 2 * x + 1; }
    }
}


/*
 * =============================================================================
 * TEXT
 * =============================================================================
 */

int Epd27Gfx::drawChar(int x, int y, char c, Epd27Color color, uint8_t size) {
    if (!font) return 0;
    if (size == 0) size = 1;

    const uint8_t* columns = font->glyph(c);

    if (columns) {
        for (uint8_t col = 0; col < font->glyphWidth(); col++) {
            uint8_t colData = columns[col];

            for (uint8_t row = 0; row < font->glyphHeight(); row++) {
                if (colData & (1 << row)) {
                    if (size == 1) {
                        plot((long long)x + col, (long long)y + row, color);
                    } else {
                        fillArea((long long)x + col * size, (long long)y + row * size, size, size, color);
                    }
                }
            }
        }
    }

    return font->advance() * size;
}


void Epd27Gfx::drawString(int x, int y, const char* str, Epd27Color color, uint8_t size) {
    if (!str) return;

    long long cursorX = x;

    while (*str) {
        // Everything further right is off the canvas too
        if (cursorX >= width) break;
        cursorX += drawChar((int)cursorX, y, *str, color, size);
        str++;
    }
}


/*
 * =============================================================================
 * BITMAPS
 * =============================================================================
 */

void Epd27Gfx::drawBitmap(const Epd27Bitmap& bitmap, int x, int y) {
    if (!bitmap.rows || bitmap.width <= 0 || bitmap.height <= 0) return;

    for (int row = 0; row < bitmap.height; row++) {
        long long ly = (long long)y + row;
        if (ly < 0 || ly >= height) continue;

        const uint8_t* line = bitmap.rows + (size_t)row * bitmap.stride;

        for (int col = 0; col < bitmap.width; col++) {
            bool set = (line[col / 8] & (0x80 >> (col % 8))) != 0;
            plot((long long)x + col, ly, (set == bitmap.setBitIsWhite) ? EPD27_WHITE : EPD27_BLACK);
        }
    }
}
