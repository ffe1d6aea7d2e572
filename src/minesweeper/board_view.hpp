#pragma once
#include "board.hpp"
#include "gui_element.hpp"
#include "../common/grid.hpp"
#include <vector>

/**
 * How a single tile should be drawn, derived from the cell and the state of
 * the board.
 */
enum class TileAppearance {
        Hidden,
        Flagged,
        Empty,
        Number,
        Mine,
        /// The mine that ended the game.
        ExplodedMine,
        /// A flag placed on a cell without a mine, shown once the game is
        /// lost.
        WrongFlag,
};

const char *tile_appearance_to_str(TileAppearance appearance);

TileAppearance tile_appearance(const Board &board, int x, int y);

/**
 * Renders the board and turns mouse input over it into cell commands:
 * releasing the primary button reveals a hidden cell (or chords a revealed
 * one) and pressing the secondary button toggles a flag. While the primary
 * button is held, the cells that would be affected are drawn pressed.
 *
 * The view does not own the board nor the layout, the game updates both
 * pointers whenever it replaces them.
 */
class BoardView : public GuiElement
{
      public:
        BoardView(const Board *board, const WindowLayout *layout);

        void set_board(const Board *board);
        void set_layout(const WindowLayout *layout);

        bool is_pressed() const { return pressed; }
        /**
         * Cells currently drawn as pressed, empty unless the primary button is
         * held over the board.
         */
        std::vector<Point> get_highlighted_cells() const;

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        const Board *board;
        const WindowLayout *layout;
        bool pressed;
        Point pointer;

        void draw_tile(Display *display, const Point &cell, bool highlighted);
};
