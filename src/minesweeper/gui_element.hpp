#pragma once
#include "../common/configuration.hpp"
#include "../common/platform/interface/display.hpp"
#include "../common/platform/interface/input.hpp"
#include "../common/point.hpp"
#include <optional>
#include <string>

/**
 * Everything the user can ask the game to do. GUI elements translate raw input
 * events into commands and the game executes them, which keeps the elements
 * unaware of the board and of each other.
 */
enum class CommandType {
        Reveal,
        ToggleFlag,
        Chord,
        Restart,
        ShowLeaderboard,
        SelectDifficulty,
        SetColumns,
        SetRows,
        SetMines,
        SubmitName,
        Dismiss,
};

const char *command_type_to_str(CommandType type);

typedef struct Command {
        CommandType type;
        /// Target cell of `Reveal`, `ToggleFlag` and `Chord`.
        Point cell;
        /// Valid for `SelectDifficulty`.
        Difficulty difficulty;
        /// Raw text entered for `SetColumns`, `SetRows`, `SetMines` and
        /// `SubmitName`.
        std::string text;
} Command;

Command make_command(CommandType type);
Command make_cell_command(CommandType type, Point cell);
Command make_difficulty_command(Difficulty difficulty);
Command make_text_command(CommandType type, const std::string &text);

/**
 * Common interface of everything that is drawn in the game window. The element
 * occupies `rect`, which the owner moves around using `set_position` once the
 * element knows its own size.
 */
class GuiElement
{
      public:
        virtual ~GuiElement() = default;

        virtual void render(Display *display) = 0;

        /**
         * Reacts to an input event, returning the command the user requested
         * (if any). Elements receive every event, including clicks outside of
         * their area.
         */
        virtual std::optional<Command> handle_event(const InputEvent &event) = 0;

        const Rect &get_rect() const { return rect; }
        void set_position(Point top_left)
        {
                rect.x = top_left.x;
                rect.y = top_left.y;
        }
        void set_center_x(int x) { rect.x = x - rect.width / 2; }

      protected:
        Rect rect = {.x = 0, .y = 0, .width = 0, .height = 0};
};

/**
 * Returns true if the event is a release of the primary button inside of
 * the rectangle. This is what counts as a click.
 */
bool is_click_inside(const InputEvent &event, const Rect *rect);
