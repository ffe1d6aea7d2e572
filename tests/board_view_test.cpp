#include "fake_platform.hpp"
#include "src/common/constants.hpp"
#include "src/minesweeper/board_view.hpp"
#include <gtest/gtest.h>

TEST(TileAppearanceTest, FinishedBoardWithoutMistakes)
{
        Board board = Board::with_mines(3, 3, {{.x = 0, .y = 0}});
        board.toggle_flag(0, 0);
        board.reveal(2, 2);

        EXPECT_EQ(tile_appearance(board, 0, 0), TileAppearance::Flagged);
        EXPECT_EQ(tile_appearance(board, 1, 1), TileAppearance::Number);
        EXPECT_EQ(tile_appearance(board, 2, 2), TileAppearance::Empty);

        Board fresh(3, 3, 1, 0);
        EXPECT_EQ(tile_appearance(fresh, 1, 1), TileAppearance::Hidden);
}

TEST(TileAppearanceTest, LostBoardShowsMistakes)
{
        Board board = Board::with_mines(3, 3, {{.x = 0, .y = 0},
                                               {.x = 2, .y = 0},
                                               {.x = 2, .y = 2}});
        board.toggle_flag(0, 0);
        board.toggle_flag(0, 2);
        board.reveal(2, 2);

        EXPECT_EQ(tile_appearance(board, 2, 2), TileAppearance::ExplodedMine);
        EXPECT_EQ(tile_appearance(board, 2, 0), TileAppearance::Mine);
        EXPECT_EQ(tile_appearance(board, 0, 0), TileAppearance::Flagged);
        EXPECT_EQ(tile_appearance(board, 0, 2), TileAppearance::WrongFlag);
        EXPECT_EQ(tile_appearance(board, 1, 1), TileAppearance::Hidden);
}

class BoardViewTest : public testing::Test
{
      protected:
        WindowLayout layout = calculate_window_layout(3, 3);
        Board board = Board::with_mines(3, 3, {{.x = 0, .y = 0}});
        BoardView view{&board, &layout};

        Point pixel_of(int x, int y)
        {
                Point cell = {.x = x, .y = y};
                Point corner = cell_to_pixel(&layout, &cell);
                return {.x = corner.x + TILE_SIZE / 2,
                        .y = corner.y + TILE_SIZE / 2};
        }

        std::optional<Command> left_click(int x, int y)
        {
                view.handle_event(make_pointer_event(PointerDown, pixel_of(x, y)));
                return view.handle_event(
                    make_pointer_event(PointerUp, pixel_of(x, y)));
        }
};

TEST_F(BoardViewTest, ReleaseOnHiddenCellReveals)
{
        std::optional<Command> command = left_click(2, 1);

        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::Reveal);
        EXPECT_EQ(command->cell, (Point{.x = 2, .y = 1}));
}

TEST_F(BoardViewTest, ReleaseOnRevealedCellChords)
{
        board.reveal(1, 1);

        std::optional<Command> command = left_click(1, 1);

        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::Chord);
}

TEST_F(BoardViewTest, SecondaryPressTogglesFlag)
{
        std::optional<Command> command = view.handle_event(
            make_pointer_event(PointerDown, pixel_of(0, 2), RightButton));

        ASSERT_TRUE(command.has_value());
        EXPECT_EQ(command->type, CommandType::ToggleFlag);
        EXPECT_EQ(command->cell, (Point{.x = 0, .y = 2}));
}

TEST_F(BoardViewTest, ReleaseOutsideOfBoardDoesNothing)
{
        view.handle_event(make_pointer_event(PointerDown, pixel_of(1, 1)));

        EXPECT_FALSE(view.handle_event(
            make_pointer_event(PointerUp, {.x = 1, .y = 1})));
        EXPECT_FALSE(view.is_pressed());
}

TEST_F(BoardViewTest, ReleaseWithoutPressDoesNothing)
{
        EXPECT_FALSE(
            view.handle_event(make_pointer_event(PointerUp, pixel_of(1, 1))));
}

TEST_F(BoardViewTest, FinishedBoardEmitsNothing)
{
        board.reveal(0, 0);
        ASSERT_TRUE(board.is_terminal());

        EXPECT_FALSE(left_click(2, 2));
        EXPECT_FALSE(view.handle_event(
            make_pointer_event(PointerDown, pixel_of(2, 2), RightButton)));
}

TEST_F(BoardViewTest, HeldButtonHighlightsCellUnderPointer)
{
        view.handle_event(make_pointer_event(PointerDown, pixel_of(2, 2)));
        std::vector<Point> highlighted = view.get_highlighted_cells();
        ASSERT_EQ(highlighted.size(), 1u);
        EXPECT_EQ(highlighted[0], (Point{.x = 2, .y = 2}));

        view.handle_event(make_pointer_event(PointerMove, pixel_of(1, 2)));
        highlighted = view.get_highlighted_cells();
        ASSERT_EQ(highlighted.size(), 1u);
        EXPECT_EQ(highlighted[0], (Point{.x = 1, .y = 2}));

        view.handle_event(make_pointer_event(PointerUp, pixel_of(1, 2)));
        EXPECT_TRUE(view.get_highlighted_cells().empty());
}

TEST_F(BoardViewTest, RenderDrawsTilesAndHighlight)
{
        RecordingDisplay display;

        view.render(&display);
        EXPECT_EQ(display.count_sprites(TileSprite), 9);

        display.calls.clear();
        view.handle_event(make_pointer_event(PointerDown, pixel_of(2, 2)));
        view.render(&display);
        EXPECT_EQ(display.count_sprites(TileSprite), 8);
}

TEST_F(BoardViewTest, RenderDrawsDigitsAndFlags)
{
        RecordingDisplay display;
        board.toggle_flag(0, 0);
        board.reveal(1, 1);

        view.render(&display);

        EXPECT_TRUE(display.has_string("1"));
        EXPECT_EQ(display.count_sprites(FlagSprite), 1);
}

TEST_F(BoardViewTest, RenderShowsExplodedMine)
{
        RecordingDisplay display;
        board.reveal(0, 0);

        view.render(&display);

        EXPECT_EQ(display.count_sprites(MineSprite), 1);
        bool red_background = std::any_of(
            display.calls.begin(), display.calls.end(),
            [](const DrawCall &call) {
                    return call.kind == RectangleDraw && call.color == Red;
            });
        EXPECT_TRUE(red_background);
}
