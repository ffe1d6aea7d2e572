#include "board.hpp"
#include "../common/logging.hpp"
#include <algorithm>
#include <deque>

#define TAG "board"

const char *board_state_to_str(BoardState state)
{
        switch (state) {
        case BoardState::Uninitialized:
                return "Uninitialized";
        case BoardState::Playing:
                return "Playing";
        case BoardState::Won:
                return "Won";
        case BoardState::Lost:
                return "Lost";
        default:
                return "Unknown";
        }
}

Board::Board(int width, int height, int mine_count, unsigned int seed)
    : width(std::max(width, 1)), height(std::max(height, 1)), mine_count(0),
      revealed_count(0), flag_count(0), state(BoardState::Uninitialized),
      losing_cell(std::nullopt), rng(seed),
      cells((size_t)this->width * this->height)
{
        int max_mines = this->width * this->height - 1;
        this->mine_count = std::clamp(mine_count, 0, max_mines);
        if (this->mine_count != mine_count) {
                LOG_WARN(TAG, "Clamped mine count from %d to %d", mine_count,
                         this->mine_count);
        }
}

Board Board::with_mines(int width, int height, const std::vector<Point> &mines)
{
        Board board(width, height, 0, 0);
        // At least one cell has to stay safe, extra mines are dropped.
        int max_mines = board.width * board.height - 1;
        int placed = 0;
        for (const Point &p : mines) {
                if (placed == max_mines) {
                        LOG_WARN(TAG, "Dropping mines past the limit of %d",
                                 max_mines);
                        break;
                }
                if (!board.is_inside(p.x, p.y) || board.cell_at(p).is_mine) {
                        continue;
                }
                board.cell_at(p).is_mine = true;
                placed++;
        }
        board.mine_count = placed;
        board.compute_adjacent_mines();
        board.state = BoardState::Playing;
        return board;
}

bool Board::is_inside(int x, int y) const
{
        Point p = {.x = x, .y = y};
        return is_inside_grid(&p, height, width);
}

bool Board::is_terminal() const
{
        return state == BoardState::Won || state == BoardState::Lost;
}

const Cell &Board::get_cell(int x, int y) const
{
        // Out of bounds reads get a hidden empty cell so that callers never
        // have to special-case the edges.
        static const Cell outside;
        if (!is_inside(x, y)) {
                return outside;
        }
        return cells[(size_t)y * width + x];
}

Cell &Board::cell_at(const Point &p) { return cells[(size_t)p.y * width + p.x]; }

bool Board::place_mines(Point exclude)
{
        if (state != BoardState::Uninitialized) {
                LOG_WARN(TAG, "Mines have already been placed.");
                return false;
        }
        if (!is_inside(exclude.x, exclude.y)) {
                return false;
        }

        std::vector<Point> neighbours =
            get_neighbours_inside_grid(&exclude, height, width);
        int cells_count = width * height;
        // We keep the whole neighbourhood of the first click free so that it
        // opens up a region. On very crowded boards that is not possible and
        // only the clicked cell itself is guaranteed to be safe.
        bool protect_neighbours =
            mine_count <= cells_count - 1 - (int)neighbours.size();

        std::vector<Point> allowed;
        allowed.reserve(cells_count);
        for (int y = 0; y < height; y++) {
                for (int x = 0; x < width; x++) {
                        Point p = {.x = x, .y = y};
                        if (p == exclude) {
                                continue;
                        }
                        if (protect_neighbours && is_adjacent(&p, &exclude)) {
                                continue;
                        }
                        allowed.push_back(p);
                }
        }

        // Partial Fisher-Yates: the first `mine_count` entries end up being a
        // uniform sample without replacement.
        for (int i = 0; i < mine_count; i++) {
                std::uniform_int_distribution<int> pick(i,
                                                        (int)allowed.size() - 1);
                std::swap(allowed[i], allowed[pick(rng)]);
                cell_at(allowed[i]).is_mine = true;
        }

        compute_adjacent_mines();
        state = BoardState::Playing;
        LOG_DEBUG(TAG, "Placed %d mines, first click at (%d, %d)", mine_count,
                  exclude.x, exclude.y);
        return true;
}

void Board::compute_adjacent_mines()
{
        for (int y = 0; y < height; y++) {
                for (int x = 0; x < width; x++) {
                        Point p = {.x = x, .y = y};
                        int count = 0;
                        for (const Point &nb :
                             get_neighbours_inside_grid(&p, height, width)) {
                                if (cell_at(nb).is_mine) {
                                        count++;
                                }
                        }
                        cell_at(p).adjacent_mines = count;
                }
        }
}

bool Board::reveal(int x, int y)
{
        if (is_terminal() || !is_inside(x, y)) {
                return false;
        }
        Point p = {.x = x, .y = y};
        if (cell_at(p).is_revealed || cell_at(p).is_flagged) {
                return false;
        }

        if (state == BoardState::Uninitialized) {
                place_mines(p);
        }

        if (cell_at(p).is_mine) {
                lose_at(p);
                return true;
        }

        reveal_region_from(p);
        finish_if_won();
        return true;
}

/**
 * Reveals `start` and, if it has no adjacent mines, the whole connected region
 * of such cells together with their numbered border. A cell is marked revealed
 * when it is enqueued, so every cell is enqueued at most once.
 */
void Board::reveal_region_from(const Point &start)
{
        std::deque<Point> queue;
        cell_at(start).is_revealed = true;
        revealed_count++;
        queue.push_back(start);

        while (!queue.empty()) {
                Point current = queue.front();
                queue.pop_front();
                if (cell_at(current).adjacent_mines > 0) {
                        continue;
                }

                for (const Point &nb :
                     get_neighbours_inside_grid(&current, height, width)) {
                        Cell &neighbour = cell_at(nb);
                        if (neighbour.is_revealed || neighbour.is_flagged ||
                            neighbour.is_mine) {
                                continue;
                        }
                        neighbour.is_revealed = true;
                        revealed_count++;
                        queue.push_back(nb);
                }
        }
}

bool Board::toggle_flag(int x, int y)
{
        if (is_terminal() || !is_inside(x, y)) {
                return false;
        }
        Cell &cell = cell_at({.x = x, .y = y});
        if (cell.is_revealed) {
                return false;
        }

        cell.is_flagged = !cell.is_flagged;
        flag_count += cell.is_flagged ? 1 : -1;
        return true;
}

bool Board::chord(int x, int y)
{
        if (is_terminal() || !is_inside(x, y)) {
                return false;
        }
        Point p = {.x = x, .y = y};
        const Cell &cell = cell_at(p);
        if (!cell.is_revealed || cell.is_mine || cell.adjacent_mines == 0) {
                return false;
        }

        std::vector<Point> neighbours =
            get_neighbours_inside_grid(&p, height, width);
        int flagged = (int)std::count_if(
            neighbours.begin(), neighbours.end(),
            [this](const Point &nb) { return cell_at(nb).is_flagged; });
        if (flagged != cell.adjacent_mines) {
                return false;
        }

        std::vector<Point> to_open;
        for (const Point &nb : neighbours) {
                const Cell &neighbour = cell_at(nb);
                if (neighbour.is_revealed || neighbour.is_flagged) {
                        continue;
                }
                if (neighbour.is_mine) {
                        // A misplaced flag: the chord opens a mine.
                        lose_at(nb);
                        return true;
                }
                to_open.push_back(nb);
        }
        if (to_open.empty()) {
                return false;
        }

        for (const Point &nb : to_open) {
                // An earlier flood fill may have opened this cell already.
                if (!cell_at(nb).is_revealed) {
                        reveal_region_from(nb);
                }
        }
        finish_if_won();
        return true;
}

bool Board::check_win() const
{
        return state != BoardState::Lost &&
               revealed_count == width * height - mine_count;
}

std::vector<Point> Board::cells_to_highlight(int x, int y) const
{
        std::vector<Point> highlighted;
        if (is_terminal() || !is_inside(x, y)) {
                return highlighted;
        }
        Point p = {.x = x, .y = y};
        const Cell &cell = get_cell(x, y);
        if (cell.is_flagged) {
                return highlighted;
        }
        if (!cell.is_revealed) {
                highlighted.push_back(p);
                return highlighted;
        }
        if (cell.adjacent_mines == 0) {
                return highlighted;
        }
        for (const Point &nb : get_neighbours_inside_grid(&p, height, width)) {
                const Cell &neighbour = get_cell(nb.x, nb.y);
                if (!neighbour.is_revealed && !neighbour.is_flagged) {
                        highlighted.push_back(nb);
                }
        }
        return highlighted;
}

void Board::lose_at(const Point &p)
{
        state = BoardState::Lost;
        losing_cell = p;
        // Every mine becomes visible; flags stay so that the view can tell
        // correctly marked mines apart.
        for (Cell &cell : cells) {
                if (cell.is_mine) {
                        cell.is_revealed = true;
                }
        }
        LOG_INFO(TAG, "Mine hit at (%d, %d), game lost.", p.x, p.y);
}

void Board::win()
{
        state = BoardState::Won;
        for (Cell &cell : cells) {
                if (cell.is_mine) {
                        cell.is_flagged = true;
                }
        }
        flag_count = mine_count;
        LOG_INFO(TAG, "All safe cells revealed, game won.");
}

void Board::finish_if_won()
{
        if (check_win()) {
                win();
        }
}
