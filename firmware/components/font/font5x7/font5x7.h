/**
 * @file font5x7.h
 * @brief Built-in 5x7 ASCII font (printable 0x20..0x7E).
 *
 * @details
 * Each glyph is 5 column bytes, bit 0 = top row. Glyphs sit in a 6x8 cell:
 * one blank column to the right and one blank row at the bottom.
 *
 *     'A' = 0x7E, 0x11, 0x11, 0x11, 0x7E
 *
 *         col 0 1 2 3 4
 *     row 0   . # # # .
 *     row 1   # . . . #
 *     row 2   # . . . #
 *     row 3   # . . . #
 *     row 4   # # # # #
 *     row 5   # . . . #
 *     row 6   # . . . #
 */

#pragma once

#include "epd27_gfx.h"


#define FONT5X7_FIRST_CHAR  0x20
#define FONT5X7_LAST_CHAR   0x7E


class Font5x7 : public Epd27GlyphSource {

public:

    uint8_t glyphWidth() const override { return 5; }
    uint8_t glyphHeight() const override { return 7; }
    uint8_t advance() const override { return 6; }

    /**
     * @brief Column bytes for @p c, nullptr outside 0x20..0x7E.
     */
    const uint8_t* glyph(char c) const override;
};


/**
 * @brief Shared instance used as the display's default font.
 */
const Font5x7& font5x7();
