#include "grid.hpp"
#include "constants.hpp"
#include "logging.hpp"
#include <algorithm>

#define TAG "grid"

WindowLayout calculate_window_layout(int rows, int cols)
{
        int board_area_width =
            std::max(cols, MIN_BOARD_DIMENSION_DISPLAY) * TILE_SIZE;
        int board_area_height =
            std::max(rows, MIN_BOARD_DIMENSION_DISPLAY) * TILE_SIZE;

        int board_width = cols * TILE_SIZE;
        int board_height = rows * TILE_SIZE;

        Rect board_area = {.x = 2 * MARGIN + GUI_WIDTH,
                           .y = 2 * MARGIN + HUD_HEIGHT,
                           .width = board_area_width,
                           .height = board_area_height};

        // The board is centered inside of the board area.
        Rect board = {.x = board_area.x + (board_area_width - board_width) / 2,
                      .y = board_area.y +
                           (board_area_height - board_height) / 2,
                      .width = board_width,
                      .height = board_height};

        Rect hud = {.x = 2 * MARGIN + GUI_WIDTH,
                    .y = MARGIN,
                    .width = board_area_width,
                    .height = HUD_HEIGHT};

        Rect gui = {.x = MARGIN,
                    .y = 2 * MARGIN + HUD_HEIGHT,
                    .width = GUI_WIDTH,
                    .height = board_area_height};

        WindowLayout layout = {
            .rows = rows,
            .cols = cols,
            .window_width = 3 * MARGIN + GUI_WIDTH + board_area_width,
            .window_height = 3 * MARGIN + HUD_HEIGHT + board_area_height,
            .board_area = board_area,
            .board = board,
            .hud = hud,
            .gui = gui};

        LOG_DEBUG(TAG,
                  "Calculated window layout: %d rows, %d cols, window %dx%d, "
                  "board at (%d, %d)",
                  rows, cols, layout.window_width, layout.window_height,
                  board.x, board.y);

        return layout;
}

void draw_grid_frame(Display *display, const WindowLayout *layout)
{
        const Rect *board = &layout->board;

        display->draw_rectangle({.x = board->x, .y = board->y}, board->width,
                                board->height, FIELD_BG_COLOR, 0, true);

        for (int i = 0; i < layout->rows; i++) {
                int y = board->y + i * TILE_SIZE;
                display->draw_line({.x = board->x, .y = y},
                                   {.x = rect_right(board), .y = y},
                                   FIELD_LINES_COLOR);
        }
        for (int j = 0; j < layout->cols; j++) {
                int x = board->x + j * TILE_SIZE;
                display->draw_line({.x = x, .y = board->y},
                                   {.x = x, .y = rect_bottom(board)},
                                   FIELD_LINES_COLOR);
        }
}

std::optional<Point> pointer_to_cell(const WindowLayout *layout,
                                     const Point *pointer)
{
        if (!is_inside(&layout->board, pointer)) {
                return std::nullopt;
        }
        return Point{.x = (pointer->x - layout->board.x) / TILE_SIZE,
                     .y = (pointer->y - layout->board.y) / TILE_SIZE};
}

Point cell_to_pixel(const WindowLayout *layout, const Point *cell)
{
        return {.x = layout->board.x + cell->x * TILE_SIZE,
                .y = layout->board.y + cell->y * TILE_SIZE};
}
