/**
 * @file test_gfx.cpp
 * @brief Drawing primitives on the packed buffer.
 */

#include <gtest/gtest.h>
#include "epd27_gfx.h"
#include "epd27_orientation.h"
#include "font5x7.h"
#include "test_support.h"
#include <limits.h>


typedef std::set<std::pair<int, int>> PixelSet;


class GfxTest : public ::testing::Test {

protected:

    Epd27FrameBuffer fb;
    Epd27Gfx gfx;

    GfxTest() : fb(EPD27_WHITE), gfx(fb) {
        gfx.setFont(&font5x7());
    }

    PixelSet black() const { return blackPixels(fb); }
};


/*
 * =============================================================================
 * PIXELS AND RUNS
 * =============================================================================
 */

TEST_F(GfxTest, PixelGoesThroughRotation) {
    gfx.setRotation(EPD27_ROTATE_90);
    gfx.drawPixel(0, 0, EPD27_BLACK);

    EXPECT_EQ(fb.getPixel(EPD27_WIDTH - 1, 0), EPD27_BLACK);
    EXPECT_EQ(gfx.getPixel(0, 0), EPD27_BLACK);
    EXPECT_EQ(black().size(), 1u);
}


TEST_F(GfxTest, HLineAndVLineLengths) {
    gfx.drawHLine(10, 20, 30, EPD27_BLACK);
    EXPECT_EQ(black().size(), 30u);
    EXPECT_EQ(fb.getPixel(10, 20), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(39, 20), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(40, 20), EPD27_WHITE);

    fb.fill(EPD27_WHITE);
    gfx.drawVLine(5, 100, 12, EPD27_BLACK);
    EXPECT_EQ(black().size(), 12u);
    EXPECT_EQ(fb.getPixel(5, 111), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(5, 112), EPD27_WHITE);
}


TEST_F(GfxTest, RunsAreClippedAtCanvasEdges) {
    gfx.drawHLine(-5, 0, 10, EPD27_BLACK);
    EXPECT_EQ(black().size(), 5u);

    fb.fill(EPD27_WHITE);
    gfx.drawVLine(0, EPD27_HEIGHT - 3, 10, EPD27_BLACK);
    EXPECT_EQ(black().size(), 3u);

    fb.fill(EPD27_WHITE);
    gfx.drawHLine(0, 0, 0, EPD27_BLACK);
    gfx.drawHLine(0, 0, -4, EPD27_BLACK);
    EXPECT_TRUE(black().empty());
}


/*
 * =============================================================================
 * LINES
 * =============================================================================
 */

TEST_F(GfxTest, LineIncludesBothEndpoints) {
    gfx.drawLine(3, 4, 40, 17, EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(3, 4), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(40, 17), EPD27_BLACK);

    // Major axis is x: one pixel per column
    EXPECT_EQ(black().size(), 38u);
}


TEST_F(GfxTest, LineIsSymmetricInEndpointOrder) {
    const int cases[][4] = {
        { 0, 0, 100, 37 },
        { 5, 200, 150, 3 },
        { 10, 10, 11, 250 },
        { 170, 5, 2, 9 },
        { 50, 50, 50, 120 },
        { 80, 60, 20, 60 },
        { 0, 0, 7, 7 },
        { -20, 30, 200, 31 },
        { 3, 1, 14, 6 },
    };

    const Epd27Rotation rotations[] = { EPD27_ROTATE_0, EPD27_ROTATE_90, EPD27_ROTATE_180, EPD27_ROTATE_270 };

    for (Epd27Rotation rotation : rotations) {
        gfx.setRotation(rotation);
        for (const auto& c : cases) {
            fb.fill(EPD27_WHITE);
            gfx.drawLine(c[0], c[1], c[2], c[3], EPD27_BLACK);
            PixelSet forward = black();

            fb.fill(EPD27_WHITE);
            gfx.drawLine(c[2], c[3], c[0], c[1], EPD27_BLACK);
            PixelSet backward = black();

            EXPECT_EQ(forward, backward) << "rotation " << (int)rotation << " line "
                                         << c[0] << "," << c[1] << " -> " << c[2] << "," << c[3];
            EXPECT_FALSE(forward.empty());
        }
    }
}


TEST_F(GfxTest, SinglePointLine) {
    gfx.drawLine(12, 34, 12, 34, EPD27_BLACK);
    PixelSet expected = { {12, 34} };
    EXPECT_EQ(black(), expected);
}


/*
 * =============================================================================
 * RECTANGLES
 * =============================================================================
 */

TEST_F(GfxTest, RectIsUnionOfItsEdges) {
    const int cases[][4] = { {10, 10, 100, 50}, {0, 0, 176, 264}, {5, 7, 1, 9}, {-10, -10, 30, 40} };

    for (const auto& c : cases) {
        int x = c[0], y = c[1], w = c[2], h = c[3];

        fb.fill(EPD27_WHITE);
        gfx.drawRect(x, y, w, h, EPD27_BLACK);
        PixelSet rect = black();

        fb.fill(EPD27_WHITE);
        gfx.drawHLine(x, y, w, EPD27_BLACK);
        gfx.drawHLine(x, y + h - 1, w, EPD27_BLACK);
        gfx.drawVLine(x, y, h, EPD27_BLACK);
        gfx.drawVLine(x + w - 1, y, h, EPD27_BLACK);

        EXPECT_EQ(rect, black()) << x << "," << y << " " << w << "x" << h;
    }
}


TEST_F(GfxTest, ZeroSizedRectDegeneratesToLineOrPoint) {
    gfx.drawRect(20, 30, 0, 5, EPD27_BLACK);
    PixelSet vertical = { {20, 30}, {20, 31}, {20, 32}, {20, 33}, {20, 34} };
    EXPECT_EQ(black(), vertical);

    fb.fill(EPD27_WHITE);
    gfx.drawRect(20, 30, 3, 0, EPD27_BLACK);
    PixelSet horizontal = { {20, 30}, {21, 30}, {22, 30} };
    EXPECT_EQ(black(), horizontal);

    fb.fill(EPD27_WHITE);
    gfx.drawRect(20, 30, 0, 0, EPD27_BLACK);
    PixelSet point = { {20, 30} };
    EXPECT_EQ(black(), point);
}


TEST_F(GfxTest, FillRectCoversExactlyTheBlock) {
    gfx.fillRect(10, 20, 7, 3, EPD27_BLACK);
    EXPECT_EQ(black().size(), 21u);
    EXPECT_EQ(fb.getPixel(16, 22), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(17, 22), EPD27_WHITE);

    fb.fill(EPD27_WHITE);
    gfx.fillRect(-5, -5, 10, 10, EPD27_BLACK);
    EXPECT_EQ(black().size(), 25u);
}


TEST_F(GfxTest, FillRectInWhiteErases) {
    fb.fill(EPD27_BLACK);
    gfx.fillRect(0, 0, 8, 1, EPD27_WHITE);
    EXPECT_EQ(fb.data()[0], 0xFF);
    EXPECT_EQ(fb.data()[1], 0x00);
}


/*
 * =============================================================================
 * CIRCLES
 * =============================================================================
 */

TEST_F(GfxTest, CircleRadiusZeroIsOnePoint) {
    gfx.drawCircle(50, 60, 0, EPD27_BLACK);
    PixelSet point = { {50, 60} };
    EXPECT_EQ(black(), point);
}


TEST_F(GfxTest, CircleIsSymmetricUnderQuarterTurn) {
    const int cx = 88, cy = 132;
    const int radii[] = { 1, 2, 5, 13, 40, 80 };

    for (int r : radii) {
        fb.fill(EPD27_WHITE);
        gfx.drawCircle(cx, cy, r, EPD27_BLACK);
        PixelSet pixels = black();

        ASSERT_FALSE(pixels.empty());
        for (const auto& p : pixels) {
            int dx = p.first - cx;
            int dy = p.second - cy;
            std::pair<int, int> turned(cx - dy, cy + dx);
            EXPECT_TRUE(pixels.count(turned)) << "r=" << r << " missing " << turned.first << "," << turned.second;
        }

        // Outline only: extreme points at exactly r
        EXPECT_EQ(fb.getPixel(cx + r, cy), EPD27_BLACK);
        EXPECT_EQ(fb.getPixel(cx, cy - r), EPD27_BLACK);
        EXPECT_EQ(fb.getPixel(cx + r + 1, cy), EPD27_WHITE);
        if (r > 1) EXPECT_EQ(fb.getPixel(cx, cy), EPD27_WHITE);
    }
}


TEST_F(GfxTest, FillCircleContainsOutlineAndCenter) {
    gfx.drawCircle(60, 60, 20, EPD27_BLACK);
    PixelSet outline = black();

    fb.fill(EPD27_WHITE);
    gfx.fillCircle(60, 60, 20, EPD27_BLACK);
    PixelSet disc = black();

    EXPECT_EQ(fb.getPixel(60, 60), EPD27_BLACK);
    for (const auto& p : outline) {
        EXPECT_TRUE(disc.count(p));
    }
    EXPECT_GT(disc.size(), outline.size());
}


/*
 * =============================================================================
 * TEXT
 * =============================================================================
 */

TEST_F(GfxTest, CharacterMatchesGlyphColumns) {
    int advance = gfx.drawChar(10, 20, 'A', EPD27_BLACK);
    EXPECT_EQ(advance, 6);

    const uint8_t* columns = font5x7().glyph('A');
    ASSERT_NE(columns, nullptr);

    for (int col = 0; col < 6; col++) {
        for (int row = 0; row < 8; row++) {
            bool ink = col < 5 && row < 7 && (columns[col] & (1 << row));
            EXPECT_EQ(fb.getPixel(10 + col, 20 + row), ink ? EPD27_BLACK : EPD27_WHITE)
                << "col " << col << " row " << row;
        }
    }
}


TEST_F(GfxTest, UnsupportedCharacterLeavesBlankCell) {
    gfx.drawString(10, 20, "\x01" "A", EPD27_BLACK);
    PixelSet withBlank = black();

    fb.fill(EPD27_WHITE);
    gfx.drawChar(16, 20, 'A', EPD27_BLACK);

    EXPECT_EQ(withBlank, black());
    for (const auto& p : withBlank) {
        EXPECT_GE(p.first, 16);
    }
}


TEST_F(GfxTest, StringAdvancesLeftToRightWithoutWrapping) {
    gfx.drawString(EPD27_WIDTH - 8, 0, "HH", EPD27_BLACK);

    for (const auto& p : black()) {
        EXPECT_LT(p.second, 8);
    }
    EXPECT_EQ(fb.getPixel(EPD27_WIDTH - 8, 0), EPD27_BLACK);
}


TEST_F(GfxTest, ScaledCharacterUsesBlocks) {
    int advance = gfx.drawChar(0, 0, 'A', EPD27_BLACK, 2);
    EXPECT_EQ(advance, 12);

    // 'A' column 1 has row 0 set, column 0 does not
    EXPECT_EQ(fb.getPixel(0, 0), EPD27_WHITE);
    EXPECT_EQ(fb.getPixel(2, 0), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(3, 1), EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(0, 2), EPD27_BLACK);
}


TEST_F(GfxTest, NoFontDrawsNothing) {
    gfx.setFont(nullptr);
    EXPECT_EQ(gfx.drawChar(0, 0, 'A', EPD27_BLACK), 0);
    gfx.drawString(0, 0, "ABC", EPD27_BLACK);
    EXPECT_TRUE(black().empty());
}


/*
 * =============================================================================
 * BITMAPS
 * =============================================================================
 */

TEST_F(GfxTest, BitmapBlitsBothColors) {
    fb.fill(EPD27_BLACK);

    const uint8_t rows[] = { 0xF0, 0x0F };
    Epd27Bitmap bmp = { 8, 2, 1, rows, false };
    gfx.drawBitmap(bmp, 0, 0);

    EXPECT_EQ(fb.data()[0], 0x0F);
    EXPECT_EQ(fb.data()[EPD27_STRIDE], 0xF0);
}


TEST_F(GfxTest, BitmapPolarity) {
    const uint8_t rows[] = { 0x80 };
    Epd27Bitmap bmp = { 1, 1, 1, rows, true };

    fb.fill(EPD27_BLACK);
    gfx.drawBitmap(bmp, 3, 3);
    EXPECT_EQ(fb.getPixel(3, 3), EPD27_WHITE);
}


TEST_F(GfxTest, BitmapIsClippedAtOrigin) {
    const uint8_t rows[] = { 0xF0, 0x0F };
    Epd27Bitmap bmp = { 8, 2, 1, rows, false };
    gfx.drawBitmap(bmp, -4, -1);

    PixelSet expected = { {0, 0}, {1, 0}, {2, 0}, {3, 0} };
    EXPECT_EQ(black(), expected);
}


/*
 * =============================================================================
 * ROBUSTNESS AND ROTATION
 * =============================================================================
 */

TEST_F(GfxTest, FarOffCanvasDrawingTouchesNothing) {
    const uint8_t rows[] = { 0xFF };
    Epd27Bitmap bmp = { 8, 1, 1, rows, false };

    const Epd27Rotation rotations[] = { EPD27_ROTATE_0, EPD27_ROTATE_90, EPD27_ROTATE_180, EPD27_ROTATE_270 };

    for (Epd27Rotation rotation : rotations) {
        gfx.setRotation(rotation);
        std::vector<uint8_t> before = snapshot(fb);

        gfx.drawPixel(100000, 5, EPD27_BLACK);
        gfx.drawPixel(-100000, -5, EPD27_BLACK);
        gfx.drawHLine(100000, 5, 50, EPD27_BLACK);
        gfx.drawVLine(5, 100000, 50, EPD27_BLACK);
        gfx.drawLine(100000, 5, 100010, 5, EPD27_BLACK);
        gfx.drawLine(100000, 100000, 100050, 100070, EPD27_BLACK);
        gfx.drawLine(-100000, 3, -99000, 90, EPD27_BLACK);
        gfx.drawRect(100000, 0, 40, 40, EPD27_BLACK);
        gfx.fillRect(100000, 0, 50, 50, EPD27_BLACK);
        gfx.fillRect(0, 100000, 50, 50, EPD27_BLACK);
        gfx.drawCircle(100000, 100000, 10, EPD27_BLACK);
        gfx.fillCircle(100000, 5, 10, EPD27_BLACK);
        gfx.drawString(100000, 0, "Overflow", EPD27_BLACK);
        gfx.drawString(0, 100000, "Overflow", EPD27_BLACK);
        gfx.drawBitmap(bmp, 100000, 0);

        EXPECT_EQ(snapshot(fb), before) << "rotation " << (int)rotation;
    }
}


TEST_F(GfxTest, DrawingAtIntLimitsTouchesNothing) {
    const uint8_t rows[] = { 0xFF, 0xFF };
    Epd27Bitmap bmp = { 16, 1, 2, rows, false };

    const Epd27Rotation rotations[] = { EPD27_ROTATE_0, EPD27_ROTATE_90, EPD27_ROTATE_180, EPD27_ROTATE_270 };

    for (Epd27Rotation rotation : rotations) {
        gfx.setRotation(rotation);
        std::vector<uint8_t> before = snapshot(fb);

        gfx.drawPixel(INT_MIN, INT_MIN, EPD27_BLACK);
        gfx.drawPixel(INT_MAX, INT_MIN, EPD27_BLACK);
        gfx.drawHLine(INT_MAX - 5, 3, INT_MAX, EPD27_BLACK);
        gfx.drawVLine(3, INT_MAX - 5, INT_MAX, EPD27_BLACK);
        gfx.drawRect(0, INT_MAX - 5, 10, 100, EPD27_BLACK);
        gfx.drawRect(INT_MAX - 3, 0, INT_MAX, 10, EPD27_BLACK);
        gfx.drawRect(INT_MIN, INT_MIN, 50, 50, EPD27_BLACK);
        gfx.drawRect(-1, -1, INT_MAX, INT_MAX, EPD27_BLACK);
        gfx.fillRect(INT_MAX - 2, INT_MAX - 2, INT_MAX, INT_MAX, EPD27_BLACK);
        gfx.drawLine(INT_MAX - 100, INT_MAX - 50, INT_MAX, INT_MAX, EPD27_BLACK);
        gfx.drawLine(INT_MIN, INT_MIN, INT_MIN + 10, INT_MAX, EPD27_BLACK);
        gfx.drawLine(INT_MAX, 0, INT_MAX, 100, EPD27_BLACK);
        gfx.drawLine(0, INT_MIN, 0, -1, EPD27_BLACK);
        gfx.drawCircle(INT_MAX - 10, 5, 50, EPD27_BLACK);
        gfx.drawCircle(INT_MIN + 3, INT_MIN + 3, 1000, EPD27_BLACK);
        gfx.fillCircle(INT_MAX - 10, INT_MAX - 10, 100, EPD27_BLACK);
        gfx.fillCircle(INT_MIN, 5, INT_MAX, EPD27_BLACK);
        gfx.drawString(INT_MAX - 3, 10, "Hello", EPD27_BLACK, 3);
        gfx.drawString(10, INT_MAX - 2, "Hi", EPD27_BLACK, 4);
        gfx.drawChar(INT_MAX - 1, INT_MAX - 1, 'W', EPD27_BLACK, 255);
        gfx.drawBitmap(bmp, INT_MAX - 2, 0);
        gfx.drawBitmap(bmp, 0, INT_MAX);

        EXPECT_EQ(snapshot(fb), before) << "rotation " << (int)rotation;
    }
}


TEST_F(GfxTest, ShapesReachingIntLimitsStillDrawTheirVisiblePart) {
    gfx.drawLine(0, 0, INT_MAX, 0, EPD27_BLACK);
    EXPECT_EQ(black().size(), (size_t)EPD27_WIDTH);

    fb.fill(EPD27_WHITE);
    gfx.drawLine(0, INT_MIN, 0, 9, EPD27_BLACK);
    EXPECT_EQ(black().size(), 10u);

    fb.fill(EPD27_WHITE);
    gfx.drawLine(5, 5, INT_MAX, INT_MAX / 2, EPD27_BLACK);
    EXPECT_EQ(fb.getPixel(5, 5), EPD27_BLACK);
    EXPECT_FALSE(black().empty());

    fb.fill(EPD27_WHITE);
    gfx.fillRect(INT_MIN, INT_MIN, INT_MAX, INT_MAX, EPD27_BLACK);
    EXPECT_TRUE(black().empty());

    fb.fill(EPD27_WHITE);
    gfx.fillRect(0, 0, INT_MAX, INT_MAX, EPD27_BLACK);
    EXPECT_EQ(black().size(), (size_t)EPD27_WIDTH * EPD27_HEIGHT);
}


TEST_F(GfxTest, RotationChangeDoesNotMoveDrawnPixels) {
    gfx.drawRect(10, 10, 40, 20, EPD27_BLACK);
    gfx.drawString(12, 40, "Keep", EPD27_BLACK);
    std::vector<uint8_t> before = snapshot(fb);

    gfx.setRotation(EPD27_ROTATE_90);
    EXPECT_EQ(snapshot(fb), before);
    EXPECT_EQ(gfx.getWidth(), 264);
    EXPECT_EQ(gfx.getHeight(), 176);

    gfx.setRotation(EPD27_ROTATE_0);
    EXPECT_EQ(snapshot(fb), before);
    EXPECT_EQ(fb.getPixel(10, 10), EPD27_BLACK);
}


TEST_F(GfxTest, LogicalDrawingLandsOnMappedPhysicalPixels) {
    const Epd27Rotation rotations[] = { EPD27_ROTATE_90, EPD27_ROTATE_180, EPD27_ROTATE_270 };

    for (Epd27Rotation rotation : rotations) {
        fb.fill(EPD27_WHITE);
        gfx.setRotation(rotation);
        gfx.drawHLine(2, 3, 10, EPD27_BLACK);

        PixelSet expected;
        for (int i = 0; i < 10; i++) {
            int px, py;
            epd27ToPhysical(rotation, 2 + i, 3, &px, &py);
            expected.insert(std::make_pair(px, py));
        }
        EXPECT_EQ(black(), expected) << "rotation " << (int)rotation;
    }
}
