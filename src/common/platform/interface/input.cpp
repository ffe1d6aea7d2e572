#include "input.hpp"

InputEvent make_pointer_event(EventType type, Point position,
                              MouseButton button)
{
        return {.type = type,
                .position = position,
                .button = button,
                .key = OtherKey,
                .character = '\0'};
}

InputEvent make_key_event(Key key)
{
        return {.type = KeyDown,
                .position = {.x = 0, .y = 0},
                .button = OtherButton,
                .key = key,
                .character = '\0'};
}

InputEvent make_text_event(char character)
{
        return {.type = TextEntered,
                .position = {.x = 0, .y = 0},
                .button = OtherButton,
                .key = OtherKey,
                .character = character};
}

InputEvent make_close_event()
{
        return {.type = CloseWindow,
                .position = {.x = 0, .y = 0},
                .button = OtherButton,
                .key = OtherKey,
                .character = '\0'};
}

const char *event_type_to_str(EventType type)
{
        switch (type) {
        case CloseWindow:
                return "CloseWindow";
        case PointerDown:
                return "PointerDown";
        case PointerUp:
                return "PointerUp";
        case PointerMove:
                return "PointerMove";
        case KeyDown:
                return "KeyDown";
        case TextEntered:
                return "TextEntered";
        default:
                return "Unknown";
        };
};

const char *mouse_button_to_str(MouseButton button)
{
        switch (button) {
        case LeftButton:
                return "Left";
        case RightButton:
                return "Right";
        case OtherButton:
                return "Other";
        default:
                return "Unknown";
        };
};

const char *key_to_str(Key key)
{
        switch (key) {
        case Enter:
                return "Enter";
        case Backspace:
                return "Backspace";
        case Escape:
                return "Escape";
        case F2:
                return "F2";
        case OtherKey:
                return "Other";
        default:
                return "Unknown";
        };
};
