#include "sfml_input_controller.hpp"
#include "../../logging.hpp"

#define TAG "sfml_input_controller"

static MouseButton map_mouse_button(sf::Mouse::Button button)
{
        switch (button) {
        case sf::Mouse::Button::Left:
                return LeftButton;
        case sf::Mouse::Button::Right:
                return RightButton;
        default:
                return OtherButton;
        }
}

static Key map_key(sf::Keyboard::Key key)
{
        switch (key) {
        case sf::Keyboard::Key::Enter:
                return Enter;
        case sf::Keyboard::Key::Backspace:
                return Backspace;
        case sf::Keyboard::Key::Escape:
                return Escape;
        case sf::Keyboard::Key::F2:
                return F2;
        default:
                return OtherKey;
        }
}

static Point to_point(sf::Vector2i position)
{
        return {.x = position.x, .y = position.y};
}

bool translate_sfml_event(const sf::Event &event, InputEvent *translated)
{
        if (event.is<sf::Event::Closed>()) {
                *translated = make_close_event();
                return true;
        }
        if (const auto *pressed = event.getIf<sf::Event::MouseButtonPressed>()) {
                *translated =
                    make_pointer_event(PointerDown, to_point(pressed->position),
                                       map_mouse_button(pressed->button));
                return true;
        }
        if (const auto *released =
                event.getIf<sf::Event::MouseButtonReleased>()) {
                *translated =
                    make_pointer_event(PointerUp, to_point(released->position),
                                       map_mouse_button(released->button));
                return true;
        }
        if (const auto *moved = event.getIf<sf::Event::MouseMoved>()) {
                *translated =
                    make_pointer_event(PointerMove, to_point(moved->position));
                return true;
        }
        if (const auto *key = event.getIf<sf::Event::KeyPressed>()) {
                *translated = make_key_event(map_key(key->code));
                return true;
        }
        if (const auto *text = event.getIf<sf::Event::TextEntered>()) {
                // Only printable ASCII makes it into names and numbers.
                if (text->unicode >= 0x20 && text->unicode < 0x7F) {
                        *translated = make_text_event((char)text->unicode);
                        return true;
                }
        }
        return false;
}

bool SfmlInputController::poll_for_input(InputEvent *event)
{
        while (const std::optional sf_event = window->pollEvent()) {
                if (translate_sfml_event(*sf_event, event)) {
                        return true;
                }
        }
        return false;
}

void SfmlInputController::setup()
{
        window->setMouseCursorVisible(true);
        window->setKeyRepeatEnabled(true);
        LOG_DEBUG(TAG, "SFML input controller ready");
}
