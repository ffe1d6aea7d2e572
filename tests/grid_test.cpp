#include "src/common/constants.hpp"
#include "src/common/grid.hpp"
#include "src/common/point.hpp"
#include <gtest/gtest.h>

TEST(GridTest, LayoutOfTheEasyBoard)
{
        WindowLayout layout = calculate_window_layout(10, 10);

        EXPECT_EQ(layout.window_width, 3 * MARGIN + GUI_WIDTH + 10 * TILE_SIZE);
        EXPECT_EQ(layout.window_height,
                  3 * MARGIN + HUD_HEIGHT + 10 * TILE_SIZE);
        EXPECT_EQ(layout.board.x, 2 * MARGIN + GUI_WIDTH);
        EXPECT_EQ(layout.board.y, 2 * MARGIN + HUD_HEIGHT);
        EXPECT_EQ(layout.board.width, 10 * TILE_SIZE);
        EXPECT_EQ(layout.gui.x, MARGIN);
        EXPECT_EQ(layout.hud.y, MARGIN);
}

TEST(GridTest, SmallBoardsAreCenteredInTheMinimumArea)
{
        WindowLayout layout = calculate_window_layout(5, 4);

        EXPECT_EQ(layout.board_area.width,
                  MIN_BOARD_DIMENSION_DISPLAY * TILE_SIZE);
        EXPECT_EQ(layout.board.width, 4 * TILE_SIZE);
        EXPECT_EQ(layout.board.height, 5 * TILE_SIZE);
        EXPECT_EQ(layout.board.x, layout.board_area.x + 3 * TILE_SIZE);
        EXPECT_EQ(layout.board.y, layout.board_area.y + (5 * TILE_SIZE) / 2);
}

TEST(GridTest, LargeBoardsGrowTheWindow)
{
        WindowLayout layout = calculate_window_layout(16, 30);

        EXPECT_EQ(layout.board_area.width, 30 * TILE_SIZE);
        EXPECT_EQ(layout.board.x, layout.board_area.x);
        EXPECT_EQ(layout.gui.height, 16 * TILE_SIZE);
}

TEST(GridTest, PointerToCell)
{
        WindowLayout layout = calculate_window_layout(10, 10);
        const Rect &board = layout.board;

        Point top_left = {.x = board.x, .y = board.y};
        Point inside_first = {.x = board.x + TILE_SIZE - 1,
                              .y = board.y + TILE_SIZE - 1};
        Point second_column = {.x = board.x + TILE_SIZE, .y = board.y};
        Point left_of_board = {.x = board.x - 1, .y = board.y};
        Point right_edge = {.x = rect_right(&board), .y = board.y};

        EXPECT_EQ(pointer_to_cell(&layout, &top_left), (Point{.x = 0, .y = 0}));
        EXPECT_EQ(pointer_to_cell(&layout, &inside_first),
                  (Point{.x = 0, .y = 0}));
        EXPECT_EQ(pointer_to_cell(&layout, &second_column),
                  (Point{.x = 1, .y = 0}));
        EXPECT_FALSE(pointer_to_cell(&layout, &left_of_board).has_value());
        EXPECT_FALSE(pointer_to_cell(&layout, &right_edge).has_value());
}

TEST(GridTest, CellToPixelMapsBack)
{
        WindowLayout layout = calculate_window_layout(8, 12);

        for (int y = 0; y < 8; y++) {
                for (int x = 0; x < 12; x++) {
                        Point cell = {.x = x, .y = y};
                        Point pixel = cell_to_pixel(&layout, &cell);
                        EXPECT_EQ(pointer_to_cell(&layout, &pixel), cell);
                }
        }
}

TEST(PointTest, NeighboursInsideGrid)
{
        Point corner = {.x = 0, .y = 0};
        Point edge = {.x = 2, .y = 0};
        Point middle = {.x = 2, .y = 2};

        EXPECT_EQ(get_neighbours_inside_grid(&corner, 5, 5).size(), 3u);
        EXPECT_EQ(get_neighbours_inside_grid(&edge, 5, 5).size(), 5u);
        EXPECT_EQ(get_neighbours_inside_grid(&middle, 5, 5).size(), 8u);
        EXPECT_TRUE(get_neighbours_inside_grid(&corner, 1, 1).empty());
}

TEST(PointTest, RectHelpers)
{
        Rect rect = {.x = 10, .y = 20, .width = 30, .height = 40};
        Point inside = {.x = 39, .y = 59};
        Point outside = {.x = 40, .y = 20};

        EXPECT_TRUE(is_inside(&rect, &inside));
        EXPECT_FALSE(is_inside(&rect, &outside));
        EXPECT_EQ(rect_center(&rect), (Point{.x = 25, .y = 40}));
        EXPECT_EQ(rect_right(&rect), 40);
        EXPECT_EQ(rect_bottom(&rect), 60);
}
