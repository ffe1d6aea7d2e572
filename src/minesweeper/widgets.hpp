#pragma once
#include "gui_element.hpp"
#include "../common/font_size.hpp"
#include <string>
#include <vector>

/* Widgets of the side panel, the HUD and the name input screen. All of them
 * use the same monospace font, so sizes are computed from string lengths. */

int text_width(const std::string &text, FontSize font_size);

class Label : public GuiElement
{
      public:
        Label(const std::string &text, FontSize font_size, Color color);

        /**
         * Replaces the text, keeping the label centered where it was.
         */
        void set_text(const std::string &text);
        const std::string &get_text() const { return text; }

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        std::string text;
        FontSize font_size;
        Color color;
};

/**
 * Text in a rectangular frame. Clicking it emits the command it was
 * created with.
 */
class Button : public GuiElement
{
      public:
        Button(const std::string &text, FontSize font_size, Color color,
               Command on_click);

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        std::string text;
        FontSize font_size;
        Color color;
        Command on_click;
};

/**
 * A titled list of difficulties with a check box next to each of them, exactly
 * one is selected at a time.
 */
class SelectionGroup : public GuiElement
{
      public:
        SelectionGroup(const std::string &title,
                       const std::vector<Difficulty> &options,
                       Difficulty initial_value, FontSize font_size,
                       Color color);

        Difficulty get_selected() const { return options[selected]; }
        void set_selected(Difficulty difficulty);

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        std::string title;
        std::vector<Difficulty> options;
        int selected;
        FontSize font_size;
        Color color;

        int item_size() const;
        Rect item_rect(int index) const;
};

/**
 * Displays "TITLE  value". When the input is active, the value is framed and
 * clicking it starts editing: digits are appended, Backspace deletes and Enter
 * emits the configured command carrying the typed text. The owner is expected
 * to call `set_value` with whatever value it actually accepted. Clicking
 * anywhere else abandons the edit.
 *
 * Inactive inputs are plain read-only counters (used for the HUD).
 */
class NumberInput : public GuiElement
{
      public:
        NumberInput(const std::string &title, int value, int width,
                    FontSize font_size, Color color,
                    CommandType on_enter = CommandType::Dismiss,
                    bool active_input = false);

        void set_value(int value);
        const std::string &get_value() const { return value; }
        const std::string &get_current_value() const { return current_value; }
        void set_active_input(bool active);
        bool is_active_input() const { return active_input; }
        bool is_editing() const { return in_input; }

        /**
         * Area of the framed value, in window pixels.
         */
        Rect value_rect() const;

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        std::string title;
        std::string value;
        std::string current_value;
        FontSize font_size;
        Color color;
        CommandType on_enter;
        bool active_input;
        bool in_input;

        std::string displayed_text() const;
        std::string displayed_value() const;
        int text_left() const;
};

/**
 * Framed prompt asking for the player's name. Only characters accepted by
 * `is_valid_name_character` are taken, up to `max_length` of them. Enter
 * submits the name and Escape dismisses the dialogue.
 */
class NameInputDialogue : public GuiElement
{
      public:
        NameInputDialogue(const std::string &title, int max_length,
                          FontSize font_size, Color color);

        void set_value(const std::string &value);
        const std::string &get_value() const { return value; }

        void render(Display *display) override;
        std::optional<Command> handle_event(const InputEvent &event) override;

      private:
        std::string title;
        std::string value;
        int max_length;
        FontSize font_size;
        Color color;
};
