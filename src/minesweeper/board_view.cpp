#include "board_view.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include <algorithm>
#include <string>

#define TAG "board_view"

const char *tile_appearance_to_str(TileAppearance appearance)
{
        switch (appearance) {
        case TileAppearance::Hidden:
                return "Hidden";
        case TileAppearance::Flagged:
                return "Flagged";
        case TileAppearance::Empty:
                return "Empty";
        case TileAppearance::Number:
                return "Number";
        case TileAppearance::Mine:
                return "Mine";
        case TileAppearance::ExplodedMine:
                return "ExplodedMine";
        case TileAppearance::WrongFlag:
                return "WrongFlag";
        default:
                return "Unknown";
        }
}

TileAppearance tile_appearance(const Board &board, int x, int y)
{
        const Cell &cell = board.get_cell(x, y);

        if (board.get_state() == BoardState::Lost) {
                if (cell.is_flagged) {
                        return cell.is_mine ? TileAppearance::Flagged
                                            : TileAppearance::WrongFlag;
                }
                if (cell.is_mine) {
                        std::optional<Point> losing = board.get_losing_cell();
                        Point p = {.x = x, .y = y};
                        if (losing.has_value() && losing.value() == p) {
                                return TileAppearance::ExplodedMine;
                        }
                        return TileAppearance::Mine;
                }
        }

        if (!cell.is_revealed) {
                return cell.is_flagged ? TileAppearance::Flagged
                                       : TileAppearance::Hidden;
        }
        if (cell.is_mine) {
                return TileAppearance::Mine;
        }
        return cell.adjacent_mines > 0 ? TileAppearance::Number
                                       : TileAppearance::Empty;
}

BoardView::BoardView(const Board *board, const WindowLayout *layout)
    : board(board), layout(layout), pressed(false), pointer({.x = 0, .y = 0})
{
        rect = layout->board;
}

void BoardView::set_board(const Board *board)
{
        this->board = board;
        pressed = false;
}

void BoardView::set_layout(const WindowLayout *layout)
{
        this->layout = layout;
        rect = layout->board;
}

std::vector<Point> BoardView::get_highlighted_cells() const
{
        if (!pressed) {
                return {};
        }
        std::optional<Point> cell = pointer_to_cell(layout, &pointer);
        if (!cell.has_value()) {
                return {};
        }
        return board->cells_to_highlight(cell->x, cell->y);
}

std::optional<Command> BoardView::handle_event(const InputEvent &event)
{
        switch (event.type) {
        case PointerDown:
                if (event.button == LeftButton) {
                        pressed = true;
                        pointer = event.position;
                } else if (event.button == RightButton) {
                        std::optional<Point> cell =
                            pointer_to_cell(layout, &event.position);
                        if (cell.has_value() && !board->is_terminal()) {
                                return make_cell_command(
                                    CommandType::ToggleFlag, cell.value());
                        }
                }
                break;
        case PointerMove:
                if (pressed) {
                        pointer = event.position;
                }
                break;
        case PointerUp: {
                if (event.button != LeftButton || !pressed) {
                        break;
                }
                pressed = false;
                std::optional<Point> cell =
                    pointer_to_cell(layout, &event.position);
                if (!cell.has_value() || board->is_terminal()) {
                        break;
                }
                const Cell &target = board->get_cell(cell->x, cell->y);
                CommandType type = target.is_revealed ? CommandType::Chord
                                                      : CommandType::Reveal;
                LOG_DEBUG(TAG, "%s requested at (%d, %d)",
                          command_type_to_str(type), cell->x, cell->y);
                return make_cell_command(type, cell.value());
        }
        default:
                break;
        }
        return std::nullopt;
}

void BoardView::render(Display *display)
{
        draw_grid_frame(display, layout);

        std::vector<Point> highlighted = get_highlighted_cells();
        for (int y = 0; y < board->get_height(); y++) {
                for (int x = 0; x < board->get_width(); x++) {
                        Point cell = {.x = x, .y = y};
                        bool is_highlighted =
                            std::find(highlighted.begin(), highlighted.end(),
                                      cell) != highlighted.end();
                        draw_tile(display, cell, is_highlighted);
                }
        }
}

void BoardView::draw_tile(Display *display, const Point &cell,
                          bool highlighted)
{
        Point position = cell_to_pixel(layout, &cell);

        switch (tile_appearance(*board, cell.x, cell.y)) {
        case TileAppearance::Hidden:
                // A pressed tile shows the bare field underneath.
                if (!highlighted) {
                        display->draw_sprite(position, TileSprite, TILE_SIZE);
                }
                break;
        case TileAppearance::Flagged:
                display->draw_sprite(position, TileSprite, TILE_SIZE);
                display->draw_sprite(position, FlagSprite, TILE_SIZE);
                break;
        case TileAppearance::Empty:
                break;
        case TileAppearance::Number: {
                int count = board->get_cell(cell.x, cell.y).adjacent_mines;
                std::string digit = std::to_string(count);
                Point text_position = {
                    .x = position.x + (TILE_SIZE - font_width(Size16)) / 2,
                    .y = position.y + (TILE_SIZE - (int)Size16) / 2};
                display->draw_string(text_position, digit.c_str(), Size16,
                                     MINE_COUNT_COLORS[count]);
        } break;
        case TileAppearance::Mine:
                display->draw_sprite(position, MineSprite, TILE_SIZE);
                break;
        case TileAppearance::ExplodedMine:
                display->draw_rectangle(position, TILE_SIZE, TILE_SIZE, Red, 0,
                                        true);
                display->draw_sprite(position, MineSprite, TILE_SIZE);
                break;
        case TileAppearance::WrongFlag:
                display->draw_sprite(position, MineSprite, TILE_SIZE);
                display->draw_line(
                    {.x = position.x, .y = position.y},
                    {.x = position.x + TILE_SIZE, .y = position.y + TILE_SIZE},
                    Red);
                display->draw_line(
                    {.x = position.x + TILE_SIZE, .y = position.y},
                    {.x = position.x, .y = position.y + TILE_SIZE}, Red);
                break;
        }
}
