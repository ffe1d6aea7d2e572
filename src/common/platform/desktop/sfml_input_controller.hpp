#pragma once
#include "../interface/controller.hpp"
#include <SFML/Graphics.hpp>

/**
 * Translates the events of an SFML window into the input events understood by
 * the game. Events the game does not care about (focus changes, key releases,
 * scrolling) are skipped.
 */
class SfmlInputController : public InputController
{
      public:
        explicit SfmlInputController(sf::RenderWindow *window)
            : window(window)
        {
        }

        bool poll_for_input(InputEvent *event) override;
        void setup() override;

      private:
        sf::RenderWindow *window;
};

bool translate_sfml_event(const sf::Event &event, InputEvent *translated);
