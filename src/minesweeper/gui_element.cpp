#include "gui_element.hpp"

const char *command_type_to_str(CommandType type)
{
        switch (type) {
        case CommandType::Reveal:
                return "Reveal";
        case CommandType::ToggleFlag:
                return "ToggleFlag";
        case CommandType::Chord:
                return "Chord";
        case CommandType::Restart:
                return "Restart";
        case CommandType::ShowLeaderboard:
                return "ShowLeaderboard";
        case CommandType::SelectDifficulty:
                return "SelectDifficulty";
        case CommandType::SetColumns:
                return "SetColumns";
        case CommandType::SetRows:
                return "SetRows";
        case CommandType::SetMines:
                return "SetMines";
        case CommandType::SubmitName:
                return "SubmitName";
        case CommandType::Dismiss:
                return "Dismiss";
        default:
                return "Unknown";
        }
}

Command make_command(CommandType type)
{
        return {.type = type,
                .cell = {.x = 0, .y = 0},
                .difficulty = Unknown,
                .text = ""};
}

Command make_cell_command(CommandType type, Point cell)
{
        Command command = make_command(type);
        command.cell = cell;
        return command;
}

Command make_difficulty_command(Difficulty difficulty)
{
        Command command = make_command(CommandType::SelectDifficulty);
        command.difficulty = difficulty;
        return command;
}

Command make_text_command(CommandType type, const std::string &text)
{
        Command command = make_command(type);
        command.text = text;
        return command;
}

bool is_click_inside(const InputEvent &event, const Rect *rect)
{
        return event.type == PointerUp && event.button == LeftButton &&
               is_inside(rect, &event.position);
}
