#pragma once
#include "../../point.hpp"

/**
 * Kinds of input that the desktop window can deliver to the game.
 */
typedef enum EventType {
        CloseWindow = 0,
        PointerDown = 1,
        PointerUp = 2,
        PointerMove = 3,
        KeyDown = 4,
        TextEntered = 5,
} EventType;

typedef enum MouseButton { LeftButton = 0, RightButton = 1, OtherButton = 2 } MouseButton;

/**
 * The handful of keys the game reacts to. Everything else arrives as `Other`
 * and, if printable, also as a separate `TextEntered` event.
 */
typedef enum Key { Enter = 0, Backspace = 1, Escape = 2, F2 = 3, OtherKey = 4 } Key;

typedef struct InputEvent {
        EventType type;
        /// Pointer position in window pixels, valid for pointer events.
        Point position;
        /// Valid for `PointerDown` and `PointerUp`.
        MouseButton button;
        /// Valid for `KeyDown`.
        Key key;
        /// Valid for `TextEntered`, always printable ASCII.
        char character;
} InputEvent;

InputEvent make_pointer_event(EventType type, Point position,
                              MouseButton button = LeftButton);
InputEvent make_key_event(Key key);
InputEvent make_text_event(char character);
InputEvent make_close_event();

const char *event_type_to_str(EventType type);
const char *mouse_button_to_str(MouseButton button);
const char *key_to_str(Key key);
