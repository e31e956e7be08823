/**
 * @file epd27_gfx.h
 * @brief Drawing primitives on a rotated view of Epd27FrameBuffer.
 *
 * @details
 * Every primitive takes logical coordinates (for the current rotation)
 * and ends in drawPixel(), which maps through epd27ToPhysical() and lets
 * the frame buffer drop anything off the panel. Shapes that spill over
 * the edge are clipped, never an error.
 */

#pragma once

#include "epd27_types.h"
#include "epd27_framebuffer.h"


/**
 * @brief Source of fixed-size glyph bitmaps, keyed by character.
 *
 * Glyph data is column-major: one byte per column, bit n = row n
 * (row 0 at the top).
 */
class Epd27GlyphSource {

public:

    virtual ~Epd27GlyphSource() {}

    /**
     * @brief Columns per glyph.
     */
    virtual uint8_t glyphWidth() const = 0;

    /**
     * @brief Rows per glyph (at most 8).
     */
    virtual uint8_t glyphHeight() const = 0;

    /**
     * @brief Horizontal distance from one character cell to the next.
     */
    virtual uint8_t advance() const = 0;

    /**
     * @brief Column bytes for @p c, or nullptr if the font has no glyph.
     */
    virtual const uint8_t* glyph(char c) const = 0;
};


/**
 * @brief A decoded 1-bit image, rows top-down, MSB = leftmost pixel.
 */
struct Epd27Bitmap {
    int width;
    int height;
    size_t stride;              ///< Bytes per row
    const uint8_t* rows;        ///< stride * height bytes
    bool setBitIsWhite;         ///< Polarity of a 1 bit
};


class Epd27Gfx {

public:

    explicit Epd27Gfx(Epd27FrameBuffer& frameBuffer, Epd27Rotation rotation = EPD27_ROTATE_0);

    /**
     * @brief Change how later logical coordinates map onto the buffer.
     *
     * @note Pixels already drawn are not moved.
     */
    void setRotation(Epd27Rotation rotation);

    Epd27Rotation getRotation() const { return rotation; }

    /**
     * @brief Logical canvas width (changes with rotation).
     */
    int getWidth() const { return width; }

    /**
     * @brief Logical canvas height (changes with rotation).
     */
    int getHeight() const { return height; }

    /**
     * @brief Font used by drawChar() / drawString(). nullptr disables text.
     */
    void setFont(const Epd27GlyphSource* glyphSource) { font = glyphSource; }

    void drawPixel(int x, int y, Epd27Color color);

    Epd27Color getPixel(int x, int y) const;

    void drawHLine(int x, int y, int w, Epd27Color color);

    void drawVLine(int x, int y, int h, Epd27Color color);

    /**
     * @brief Bresenham line, both endpoints included.
     *
     * (x0,y0)->(x1,y1) and (x1,y1)->(x0,y0) produce the same pixels.
     */
    void drawLine(int x0, int y0, int x1, int y1, Epd27Color color);

    /**
     * @brief Rectangle outline. A zero width or height collapses to a
     *        1-pixel line (or a point).
     */
    void drawRect(int x, int y, int w, int h, Epd27Color color);

    void fillRect(int x, int y, int w, int h, Epd27Color color);

    /**
     * @brief Midpoint circle outline. Radius 0 draws a single point.
     */
    void drawCircle(int cx, int cy, int radius, Epd27Color color);

    void fillCircle(int cx, int cy, int radius, Epd27Color color);

    /**
     * @brief Draw one character cell.
     *
     * Only glyph pixels are drawn; the background is left alone.
     * Characters the font does not have leave a blank cell.
     *
     * @param size Scale factor (1 = native glyph size).
     * @return Advance to the next cell, in pixels.
     */
    int drawChar(int x, int y, char c, Epd27Color color, uint8_t size = 1);

    /**
     * @brief Draw a string left to right. No wrapping.
     */
    void drawString(int x, int y, const char* str, Epd27Color color, uint8_t size = 1);

    /**
     * @brief Blit a 1-bit bitmap with its top-left corner at (x, y).
     */
    void drawBitmap(const Epd27Bitmap& bitmap, int x, int y);

private:

    // Widened helpers: callers pass sums of caller coordinates, which may
    // leave the int range. Everything off the canvas is skipped.
    void plot(long long x, long long y, Epd27Color color);
    void hRun(long long x, long long y, long long w, Epd27Color color);
    void vRun(long long x, long long y, long long h, Epd27Color color);
    void fillArea(long long x, long long y, long long w, long long h, Epd27Color color);

    Epd27FrameBuffer& frameBuffer;
    const Epd27GlyphSource* font;

    Epd27Rotation rotation;
    int width;
    int height;
};
