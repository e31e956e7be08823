/**
 * @file epd27_orientation.cpp
 * @brief Rotation formulas.
 */

#include "epd27_orientation.h"
#include <limits.h>


// extent - 1 - v without overflowing int. Results past the int range are
// pinned to it, which is still off the panel.
static int mirror(int extent, int v) {
    long long r = (long long)extent - 1 - v;
    if (r > INT_MAX) return INT_MAX;
    if (r < INT_MIN) return INT_MIN;
    return (int)r;
}


void epd27LogicalSize(Epd27Rotation rotation, int* width, int* height) {
    switch (rotation) {
        case EPD27_ROTATE_90:
        case EPD27_ROTATE_270:
            *width = EPD27_HEIGHT;
            *height = EPD27_WIDTH;
            break;
        case EPD27_ROTATE_0:
        case EPD27_ROTATE_180:
        default:
            *width = EPD27_WIDTH;
            *height = EPD27_HEIGHT;
            break;
    }
}


void epd27ToPhysical(Epd27Rotation rotation, int lx, int ly, int* px, int* py) {
    switch (rotation) {
        case EPD27_ROTATE_90:
            *px = mirror(EPD27_WIDTH, ly);
            *py = lx;
            break;
        case EPD27_ROTATE_180:
            *px = mirror(EPD27_WIDTH, lx);
            *py = mirror(EPD27_HEIGHT, ly);
            break;
        case EPD27_ROTATE_270:
            *px = ly;
            *py = mirror(EPD27_HEIGHT, lx);
            break;
        case EPD27_ROTATE_0:
        default:
            *px = lx;
            *py = ly;
            break;
    }
}


void epd27ToLogical(Epd27Rotation rotation, int px, int py, int* lx, int* ly) {
    switch (rotation) {
        case EPD27_ROTATE_90:
            *lx = py;
            *ly = mirror(EPD27_WIDTH, px);
            break;
        case EPD27_ROTATE_180:
            *lx = mirror(EPD27_WIDTH, px);
            *ly = mirror(EPD27_HEIGHT, py);
            break;
        case EPD27_ROTATE_270:
            *lx = mirror(EPD27_HEIGHT, py);
            *ly = px;
            break;
        case EPD27_ROTATE_0:
        default:
            *lx = px;
            *ly = py;
            break;
    }
}
