#pragma once
#include "../common/point.hpp"
#include <optional>
#include <random>
#include <vector>

typedef struct Cell {
        bool is_mine;
        bool is_revealed;
        bool is_flagged;
        /// Number of mines among the up-to-8 neighbours, valid once the mines
        /// are placed.
        int adjacent_mines;

        Cell()
            : is_mine(false), is_revealed(false), is_flagged(false),
              adjacent_mines(0)
        {
        }
} Cell;

/**
 * Lifecycle of a board. Mines are only placed on the first reveal, which moves
 * the board from `Uninitialized` to `Playing`. `Won` and `Lost` are terminal:
 * the board ignores every mutating operation once it reaches them.
 */
enum class BoardState {
        Uninitialized,
        Playing,
        Won,
        Lost,
};

const char *board_state_to_str(BoardState state);

/**
 * Minesweeper board: a `width` x `height` grid of cells addressed by (x, y),
 * where x is the column and y the row.
 *
 * All operations silently ignore coordinates outside of the grid and return
 * false if they did not change the board.
 */
class Board
{
      public:
        /**
         * Creates an empty board. `mine_count` is clamped so that at least one
         * cell is free of mines. The seed drives mine placement, so two boards
         * created with the same parameters and played the same way are
         * identical.
         */
        Board(int width, int height, int mine_count, unsigned int seed);

        /**
         * Creates a board in the `Playing` state with mines at exactly the
         * given positions. Positions outside of the grid and duplicates are
         * ignored, as is every mine past `width * height - 1`.
         */
        static Board with_mines(int width, int height,
                                const std::vector<Point> &mines);

        /**
         * Reveals a cell. The first reveal places the mines so that the
         * revealed cell is never one of them. Revealing a mine loses the game
         * and uncovers every mine. Revealing a cell without adjacent mines
         * flood-fills the connected empty region together with its numbered
         * border.
         */
        bool reveal(int x, int y);

        /**
         * Flags or unflags a hidden cell. Flagged cells cannot be revealed.
         */
        bool toggle_flag(int x, int y);

        /**
         * Reveals all hidden, unflagged neighbours of a revealed numbered
         * cell, provided the number of flags around it equals its number.
         * If any of those neighbours is a mine the game is lost.
         */
        bool chord(int x, int y);

        /**
         * True iff every cell without a mine has been revealed.
         */
        bool check_win() const;

        /**
         * Places the mines uniformly at random, keeping `exclude` and (if the
         * board has room for it) its neighbours free, and computes the
         * adjacency counts. Only valid on an `Uninitialized` board.
         */
        bool place_mines(Point exclude);

        /**
         * Cells that should be rendered as pressed while the primary button is
         * held over (x, y): the cell itself if hidden, or the hidden neighbours
         * of a revealed numbered cell (as a hint of what a chord would open).
         */
        std::vector<Point> cells_to_highlight(int x, int y) const;

        const Cell &get_cell(int x, int y) const;
        bool is_inside(int x, int y) const;
        bool is_terminal() const;

        int get_width() const { return width; }
        int get_height() const { return height; }
        int get_mine_count() const { return mine_count; }
        BoardState get_state() const { return state; }
        int get_revealed_count() const { return revealed_count; }
        int get_flag_count() const { return flag_count; }
        /// Mines minus flags, negative if the player placed too many flags.
        int mines_left() const { return mine_count - flag_count; }
        /// The mine that ended the game, set only in the `Lost` state.
        std::optional<Point> get_losing_cell() const { return losing_cell; }

      private:
        int width;
        int height;
        int mine_count;
        int revealed_count;
        int flag_count;
        BoardState state;
        std::optional<Point> losing_cell;
        std::mt19937 rng;
        std::vector<Cell> cells;

        Cell &cell_at(const Point &p);
        void compute_adjacent_mines();
        void reveal_region_from(const Point &start);
        void lose_at(const Point &p);
        void win();
        void finish_if_won();
};
