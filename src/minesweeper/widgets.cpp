#include "widgets.hpp"
#include "leaderboard.hpp"
#include "../common/constants.hpp"
#include "../common/logging.hpp"
#include <algorithm>
#include <cctype>

#define TAG "widgets"

int text_width(const std::string &text, FontSize font_size)
{
        return (int)text.size() * font_width(font_size);
}

/* Label */

Label::Label(const std::string &text, FontSize font_size, Color color)
    : text(text), font_size(font_size), color(color)
{
        rect.width = text_width(text, font_size);
        rect.height = line_height(font_size);
}

void Label::set_text(const std::string &text)
{
        Point center = rect_center(&rect);
        this->text = text;
        rect.width = text_width(text, font_size);
        rect.x = center.x - rect.width / 2;
}

void Label::render(Display *display)
{
        display->draw_string({.x = rect.x, .y = rect.y}, text.c_str(),
                             font_size, color);
}

std::optional<Command> Label::handle_event(const InputEvent &event)
{
        return std::nullopt;
}

/* Button */

Button::Button(const std::string &text, FontSize font_size, Color color,
               Command on_click)
    : text(text), font_size(font_size), color(color), on_click(on_click)
{
        int margin = 3 * font_width(font_size) / 2;
        rect.width = text_width(text, font_size) + margin;
        rect.height = 6 * line_height(font_size) / 5;
}

void Button::render(Display *display)
{
        display->draw_rectangle({.x = rect.x, .y = rect.y}, rect.width,
                                rect.height, color, 1, false);
        int text_x = rect.x + (rect.width - text_width(text, font_size)) / 2;
        int text_y = rect.y + (rect.height - (int)font_size) / 2;
        display->draw_string({.x = text_x, .y = text_y}, text.c_str(),
                             font_size, color);
}

std::optional<Command> Button::handle_event(const InputEvent &event)
{
        if (is_click_inside(event, &rect)) {
                LOG_DEBUG(TAG, "Button '%s' clicked", text.c_str());
                return on_click;
        }
        return std::nullopt;
}

/* SelectionGroup */

SelectionGroup::SelectionGroup(const std::string &title,
                               const std::vector<Difficulty> &options,
                               Difficulty initial_value, FontSize font_size,
                               Color color)
    : title(title), options(options), selected(0), font_size(font_size),
      color(color)
{
        int item = item_size();
        int width = text_width(title, font_size);
        for (Difficulty option : options) {
                int item_width =
                    3 * item / 2 +
                    text_width(difficulty_to_string(option), font_size);
                width = std::max(width, item_width);
        }
        rect.width = width;
        rect.height = line_height(font_size) + item / 2 +
                      3 * item * (int)options.size() / 2;
        set_selected(initial_value);
}

int SelectionGroup::item_size() const { return line_height(font_size); }

Rect SelectionGroup::item_rect(int index) const
{
        int item = item_size();
        return {.x = rect.x,
                .y = rect.y + line_height(font_size) + item / 2 +
                     3 * item * index / 2,
                .width = rect.width,
                .height = item};
}

void SelectionGroup::set_selected(Difficulty difficulty)
{
        for (size_t i = 0; i < options.size(); i++) {
                if (options[i] == difficulty) {
                        selected = (int)i;
                        return;
                }
        }
}

void SelectionGroup::render(Display *display)
{
        int title_x = rect.x + (rect.width - text_width(title, font_size)) / 2;
        display->draw_string({.x = title_x, .y = rect.y}, title.c_str(),
                             font_size, color);

        int item = item_size();
        for (size_t i = 0; i < options.size(); i++) {
                Rect box = item_rect((int)i);
                box.width = item;
                display->draw_rectangle({.x = box.x, .y = box.y}, box.width,
                                        box.height, color, 1, false);
                if ((int)i == selected) {
                        int shift = 3 * item / 10;
                        display->draw_line(
                            {.x = box.x + shift, .y = box.y + shift},
                            {.x = box.x + item - shift,
                             .y = box.y + item - shift},
                            color);
                        display->draw_line(
                            {.x = box.x + item - shift, .y = box.y + shift},
                            {.x = box.x + shift, .y = box.y + item - shift},
                            color);
                }
                display->draw_string({.x = box.x + 3 * item / 2, .y = box.y},
                                     difficulty_to_string(options[i]),
                                     font_size, color);
        }
}

std::optional<Command> SelectionGroup::handle_event(const InputEvent &event)
{
        for (size_t i = 0; i < options.size(); i++) {
                Rect item = item_rect((int)i);
                if (!is_click_inside(event, &item)) {
                        continue;
                }
                if ((int)i == selected) {
                        return std::nullopt;
                }
                selected = (int)i;
                LOG_DEBUG(TAG, "Selected difficulty %s",
                          difficulty_to_string(options[i]));
                return make_difficulty_command(options[i]);
        }
        return std::nullopt;
}

/* NumberInput */

static const char *NUMBER_INPUT_DELIMITER = "  ";

NumberInput::NumberInput(const std::string &title, int value, int width,
                         FontSize font_size, Color color, CommandType on_enter,
                         bool active_input)
    : title(title), value(std::to_string(value)),
      current_value(std::to_string(value)), font_size(font_size),
      color(color), on_enter(on_enter), active_input(active_input),
      in_input(false)
{
        rect.width = width;
        rect.height = line_height(font_size);
}

void NumberInput::set_value(int value)
{
        this->value = std::to_string(value);
        current_value = this->value;
}

void NumberInput::set_active_input(bool active)
{
        active_input = active;
        if (!active) {
                in_input = false;
                current_value = value;
        }
}

std::string NumberInput::displayed_value() const
{
        return in_input ? current_value + "_" : current_value;
}

std::string NumberInput::displayed_text() const
{
        return title + NUMBER_INPUT_DELIMITER + displayed_value();
}

int NumberInput::text_left() const
{
        return rect.x +
               (rect.width - text_width(displayed_text(), font_size)) / 2;
}

Rect NumberInput::value_rect() const
{
        int margin = font_width(font_size);
        int title_width =
            text_width(title + NUMBER_INPUT_DELIMITER, font_size);
        return {.x = text_left() + title_width - margin,
                .y = rect.y,
                .width = text_width(displayed_value(), font_size) + 2 * margin,
                .height = rect.height};
}

void NumberInput::render(Display *display)
{
        if (active_input) {
                Rect frame = value_rect();
                display->draw_rectangle({.x = frame.x, .y = frame.y},
                                        frame.width, frame.height, color, 1,
                                        false);
        }
        display->draw_string({.x = text_left(), .y = rect.y},
                             displayed_text().c_str(), font_size, color);
}

std::optional<Command> NumberInput::handle_event(const InputEvent &event)
{
        if (!active_input) {
                return std::nullopt;
        }

        switch (event.type) {
        case PointerUp: {
                if (event.button != LeftButton) {
                        break;
                }
                Rect frame = value_rect();
                if (is_inside(&frame, &event.position)) {
                        in_input = true;
                } else {
                        in_input = false;
                        current_value = value;
                }
        } break;
        case TextEntered:
                if (in_input && std::isdigit((unsigned char)event.character) &&
                    (int)current_value.size() < MAX_NUMBER_INPUT_LENGTH) {
                        current_value += event.character;
                }
                break;
        case KeyDown:
                if (!in_input) {
                        break;
                }
                if (event.key == Backspace && !current_value.empty()) {
                        current_value.pop_back();
                } else if (event.key == Enter) {
                        in_input = false;
                        LOG_DEBUG(TAG, "Input %s entered '%s'", title.c_str(),
                                  current_value.c_str());
                        return make_text_command(on_enter, current_value);
                }
                break;
        default:
                break;
        }
        return std::nullopt;
}

/* NameInputDialogue */

NameInputDialogue::NameInputDialogue(const std::string &title, int max_length,
                                     FontSize font_size, Color color)
    : title(title), value(), max_length(max_length), font_size(font_size),
      color(color)
{
        int line = line_height(font_size);
        rect.width = text_width(title, font_size) + 2 * font_width(font_size);
        rect.height = 3 * (line / 2) + 2 * line;
}

void NameInputDialogue::set_value(const std::string &value)
{
        this->value = value;
}

void NameInputDialogue::render(Display *display)
{
        int line = line_height(font_size);
        int vertical_margin = line / 2;

        display->draw_rectangle({.x = rect.x, .y = rect.y}, rect.width,
                                rect.height, color, 1, false);
        display->draw_string(
            {.x = rect.x + font_width(font_size), .y = rect.y + vertical_margin},
            title.c_str(), font_size, color);

        std::string shown = value + "_";
        int value_x = rect.x + (rect.width - text_width(shown, font_size)) / 2;
        display->draw_string(
            {.x = value_x, .y = rect.y + 2 * vertical_margin + line},
            shown.c_str(), font_size, color);
}

std::optional<Command> NameInputDialogue::handle_event(const InputEvent &event)
{
        switch (event.type) {
        case TextEntered:
                if ((int)value.size() < max_length &&
                    is_valid_name_character(event.character)) {
                        value += event.character;
                }
                break;
        case KeyDown:
                if (event.key == Backspace && !value.empty()) {
                        value.pop_back();
                } else if (event.key == Enter) {
                        return make_text_command(CommandType::SubmitName,
                                                 value);
                } else if (event.key == Escape) {
                        return make_command(CommandType::Dismiss);
                }
                break;
        default:
                break;
        }
        return std::nullopt;
}
