/**
 * @file epd27_orientation.h
 * @brief Logical <-> physical coordinate mapping for the four rotations.
 *
 * @details
 * Physical origin is the panel's top-left in portrait, W = 176, H = 264.
 *
 *     rotation   logical size   physical (px, py)
 *     ────────   ────────────   ─────────────────────
 *        0        176 x 264     (lx,        ly)
 *        1        264 x 176     (W-1-ly,    lx)
 *        2        176 x 264     (W-1-lx,    H-1-ly)
 *        3        264 x 176     (ly,        H-1-lx)
 *
 * No bounds checking here. A logical coordinate outside the canvas maps to a
 * physical coordinate outside the panel, and Epd27FrameBuffer drops it.
 * Mirrored values that would leave the int range are pinned to its ends.
 */

#pragma once

#include "epd27_types.h"


/**
 * @brief Logical canvas size for a rotation.
 */
void epd27LogicalSize(Epd27Rotation rotation, int* width, int* height);

/**
 * @brief Map a logical coordinate to the physical buffer.
 */
void epd27ToPhysical(Epd27Rotation rotation, int lx, int ly, int* px, int* py);

/**
 * @brief Inverse of epd27ToPhysical().
 */
void epd27ToLogical(Epd27Rotation rotation, int px, int py, int* lx, int* ly);
