#pragma once
#include "platform/interface/display.hpp"
#include "point.hpp"
#include <optional>

/**
 * Stores the placement of every region of the game window. The window is
 * split as follows (not to scale):
 *
 *   +------------------------------------+
 *   |             | hud                  |
 *   | gui (side   |----------------------|
 *   |  panel)     | board area           |
 *   |             |    +-----------+     |
 *   |             |    |   board   |     |
 *   |             |    +-----------+     |
 *   +------------------------------------+
 *
 * The board area is never smaller than MIN_BOARD_DIMENSION_DISPLAY tiles in
 * each direction; smaller boards are centered inside of it.
 */
typedef struct WindowLayout {
        int rows;
        int cols;
        int window_width;
        int window_height;
        Rect board_area;
        Rect board;
        Rect hud;
        Rect gui;
} WindowLayout;

WindowLayout calculate_window_layout(int rows, int cols);

/**
 * Draws the board background: a solid field with grid lines separating the
 * tiles.
 */
void draw_grid_frame(Display *display, const WindowLayout *layout);

/**
 * Maps a pointer position in window pixels to the grid cell under it. Returns
 * `std::nullopt` if the pointer is outside of the board.
 */
std::optional<Point> pointer_to_cell(const WindowLayout *layout,
                                     const Point *pointer);

/**
 * Returns the pixel position of the top left corner of the cell.
 */
Point cell_to_pixel(const WindowLayout *layout, const Point *cell);
